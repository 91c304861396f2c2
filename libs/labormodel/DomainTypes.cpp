#include "DomainTypes.h"
#include <stdexcept>

namespace labormodel
{
  std::string toString(HeadcountSourceType type)
  {
    switch (type)
      {
      case HeadcountSourceType::Posting:
	return "posting";
      case HeadcountSourceType::Visa:
	return "visa";
      case HeadcountSourceType::Payroll:
	return "payroll";
      }
    throw std::logic_error("toString: unhandled headcount source type");
  }

  std::string toString(SalarySourceType type)
  {
    switch (type)
      {
      case SalarySourceType::Payroll:
	return "payroll";
      case SalarySourceType::VisaFiling:
	return "visa";
      case SalarySourceType::NegotiatedWageTable:
	return "wage_table";
      case SalarySourceType::AtsPosting:
	return "ats_posting";
      case SalarySourceType::Posting:
	return "posting";
      }
    throw std::logic_error("toString: unhandled salary source type");
  }

  std::string toString(RecordType type)
  {
    switch (type)
      {
      case RecordType::Observed:
	return "observed";
      case RecordType::KnownEmployerInferred:
	return "inferred";
      case RecordType::CbpSynthetic:
	return "synthetic";
      }
    throw std::logic_error("toString: unhandled record type");
  }

  std::string toString(Seniority seniority)
  {
    switch (seniority)
      {
      case Seniority::Intern:
	return "intern";
      case Seniority::Entry:
	return "entry";
      case Seniority::Mid:
	return "mid";
      case Seniority::Senior:
	return "senior";
      case Seniority::Lead:
	return "lead";
      case Seniority::Manager:
	return "manager";
      case Seniority::Director:
	return "director";
      case Seniority::Executive:
	return "exec";
      }
    throw std::logic_error("toString: unhandled seniority");
  }

  std::string toString(EstimationMethod method)
  {
    switch (method)
      {
      case EstimationMethod::DirichletShrinkage:
	return "dirichlet_shrinkage";
      case EstimationMethod::BayesianShrinkage:
	return "bayesian_shrinkage";
      }
    throw std::logic_error("toString: unhandled estimation method");
  }

  HeadcountSourceType parseHeadcountSourceType(const std::string& name)
  {
    if (name == "posting")
      return HeadcountSourceType::Posting;
    if (name == "visa")
      return HeadcountSourceType::Visa;
    if (name == "payroll")
      return HeadcountSourceType::Payroll;

    throw std::invalid_argument("Unknown headcount source type: " + name);
  }

  SalarySourceType parseSalarySourceType(const std::string& name)
  {
    if (name == "payroll")
      return SalarySourceType::Payroll;
    if (name == "visa")
      return SalarySourceType::VisaFiling;
    if (name == "wage_table")
      return SalarySourceType::NegotiatedWageTable;
    if (name == "ats_posting")
      return SalarySourceType::AtsPosting;
    if (name == "posting")
      return SalarySourceType::Posting;

    throw std::invalid_argument("Unknown salary source type: " + name);
  }

  RecordType parseRecordType(const std::string& name)
  {
    if (name == "observed")
      return RecordType::Observed;
    if (name == "inferred")
      return RecordType::KnownEmployerInferred;
    if (name == "synthetic")
      return RecordType::CbpSynthetic;

    throw std::invalid_argument("Unknown record type: " + name);
  }

  Seniority parseSeniority(const std::string& name)
  {
    if (name == "intern")
      return Seniority::Intern;
    if (name == "entry")
      return Seniority::Entry;
    if (name == "mid")
      return Seniority::Mid;
    if (name == "senior")
      return Seniority::Senior;
    if (name == "lead")
      return Seniority::Lead;
    if (name == "manager")
      return Seniority::Manager;
    if (name == "director")
      return Seniority::Director;
    if (name == "exec" || name == "executive")
      return Seniority::Executive;

    throw std::invalid_argument("Unknown seniority: " + name);
  }

  std::ostream& operator<<(std::ostream& os, const MetroRoleKey& key)
  {
    return os << key.toString();
  }
}

#include "EngineConfiguration.h"
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

using namespace rapidjson;

namespace labormodel
{
  void OccupationMix::setIndustryMix(const std::string& industry, std::vector<RoleFraction> mix)
  {
    mMix[industry] = std::move(mix);
  }

  const std::vector<RoleFraction>& OccupationMix::getMix(const std::string& industry) const
  {
    static const std::vector<RoleFraction> emptyMix;

    auto it = mMix.find(industry);
    if (it != mMix.end())
      return it->second;

    it = mMix.find(FALLBACK_INDUSTRY);
    if (it != mMix.end())
      return it->second;

    return emptyMix;
  }

  EngineConfiguration::EngineConfiguration()
    : mHeadcount(),
      mSalary(),
      mConfidence(),
      mOccupationMix(),
      mSourceWeights()
  {}

  EngineConfiguration::EngineConfiguration(const HeadcountModelParameters& headcount,
					   const SalaryModelParameters& salary,
					   const ConfidenceParameters& confidence,
					   const OccupationMix& occupationMix,
					   const SourceWeights& sourceWeights)
    : mHeadcount(headcount),
      mSalary(salary),
      mConfidence(confidence),
      mOccupationMix(occupationMix),
      mSourceWeights(sourceWeights)
  {
    validate();
  }

  double EngineConfiguration::getHeadcountSourceWeight(HeadcountSourceType type) const
  {
    switch (type)
      {
      case HeadcountSourceType::Posting:
	return mSourceWeights.headcount.posting;
      case HeadcountSourceType::Visa:
	return mSourceWeights.headcount.visa;
      case HeadcountSourceType::Payroll:
	return mSourceWeights.headcount.payroll;
      }
    throw std::logic_error("EngineConfiguration::getHeadcountSourceWeight: unhandled source type");
  }

  double EngineConfiguration::getSalarySourceWeight(SalarySourceType type) const
  {
    switch (type)
      {
      case SalarySourceType::Payroll:
	return mSourceWeights.salary.payroll;
      case SalarySourceType::VisaFiling:
	return mSourceWeights.salary.visaFiling;
      case SalarySourceType::NegotiatedWageTable:
	return mSourceWeights.salary.wageTable;
      case SalarySourceType::AtsPosting:
	return mSourceWeights.salary.atsPosting;
      case SalarySourceType::Posting:
	return mSourceWeights.salary.posting;
      }
    throw std::logic_error("EngineConfiguration::getSalarySourceWeight: unhandled source type");
  }

  const ConfidenceBand& EngineConfiguration::getConfidenceBand(RecordType type) const
  {
    switch (type)
      {
      case RecordType::Observed:
	return mConfidence.observed;
      case RecordType::KnownEmployerInferred:
	return mConfidence.knownEmployerInferred;
      case RecordType::CbpSynthetic:
	return mConfidence.cbpSynthetic;
      }
    throw std::logic_error("EngineConfiguration::getConfidenceBand: unhandled record type");
  }

  EngineConfiguration EngineConfiguration::withMonteCarloSamples(unsigned int samples) const
  {
    HeadcountModelParameters headcount(mHeadcount);
    headcount.monteCarloSamples = samples;
    return EngineConfiguration(headcount, mSalary, mConfidence, mOccupationMix, mSourceWeights);
  }

  static void validateBand(const ConfidenceBand& band, const std::string& name)
  {
    if (!(band.floor >= 0.0) || !(band.ceiling <= 1.0) || band.floor > band.ceiling)
      throw EngineConfigurationException("EngineConfiguration: confidence band '" + name +
					 "' must satisfy 0 <= floor <= ceiling <= 1");
  }

  static void validateWeight(double weight, const std::string& name)
  {
    if (!(weight > 0.0))
      throw EngineConfigurationException("EngineConfiguration: source weight '" + name + "' must be positive");
  }

  void EngineConfiguration::validate() const
  {
    if (!(mHeadcount.priorWeight > 0.0))
      throw EngineConfigurationException("EngineConfiguration: prior_weight must be positive");

    if (!(mHeadcount.concentrationScale > 0.0))
      throw EngineConfigurationException("EngineConfiguration: concentration_scale must be positive");

    if (!(mHeadcount.minEvidenceThreshold >= 0.0))
      throw EngineConfigurationException("EngineConfiguration: min_evidence_threshold must be non-negative");

    if (mHeadcount.monteCarloSamples == 0)
      throw EngineConfigurationException("EngineConfiguration: monte_carlo_samples must be at least 1");

    if (!(mSalary.priorEffectiveN > 0.0))
      throw EngineConfigurationException("EngineConfiguration: prior_effective_n must be positive");

    if (!(mSalary.priorCoefficientOfVariation > 0.0))
      throw EngineConfigurationException("EngineConfiguration: prior_cv must be positive");

    if (!(mSalary.minPlausibleSalary >= 0.0) ||
	!(mSalary.maxPlausibleSalary > mSalary.minPlausibleSalary))
      throw EngineConfigurationException("EngineConfiguration: plausible salary range is empty");

    validateBand(mConfidence.observed, "observed");
    validateBand(mConfidence.knownEmployerInferred, "inferred");
    validateBand(mConfidence.cbpSynthetic, "synthetic");

    if (!(mConfidence.evidenceScale > 0.0))
      throw EngineConfigurationException("EngineConfiguration: evidence_scale must be positive");

    if (!(mConfidence.syntheticOverlapDiscount > 0.0) || mConfidence.syntheticOverlapDiscount > 1.0)
      throw EngineConfigurationException("EngineConfiguration: synthetic_overlap_discount must be in (0, 1]");

    validateWeight(mSourceWeights.headcount.posting, "headcount.posting");
    validateWeight(mSourceWeights.headcount.visa, "headcount.visa");
    validateWeight(mSourceWeights.headcount.payroll, "headcount.payroll");
    validateWeight(mSourceWeights.salary.payroll, "salary.payroll");
    validateWeight(mSourceWeights.salary.visaFiling, "salary.visa");
    validateWeight(mSourceWeights.salary.wageTable, "salary.wage_table");
    validateWeight(mSourceWeights.salary.atsPosting, "salary.ats_posting");
    validateWeight(mSourceWeights.salary.posting, "salary.posting");

    for (const auto& entry : mOccupationMix.getAllMixes())
      {
	double total = 0.0;
	for (const auto& roleFraction : entry.second)
	  {
	    if (!(roleFraction.fraction >= 0.0) || roleFraction.fraction > 1.0)
	      throw EngineConfigurationException("EngineConfiguration: occupation fraction for industry '" +
						 entry.first + "' must be in [0, 1]");
	    total += roleFraction.fraction;
	  }

	if (total > 1.0 + 1e-9)
	  throw EngineConfigurationException("EngineConfiguration: occupation fractions for industry '" +
					     entry.first + "' sum to more than 1");
      }
  }

  //
  // JSON reader
  //

  static double readDouble(const Value& section, const char* name, double defaultValue)
  {
    if (!section.HasMember(name))
      return defaultValue;

    const Value& v = section[name];
    if (!v.IsNumber())
      throw EngineConfigurationException(std::string("EngineConfigurationFileReader: '") + name +
					 "' must be a number");
    return v.GetDouble();
  }

  static unsigned int readUnsigned(const Value& section, const char* name, unsigned int defaultValue)
  {
    if (!section.HasMember(name))
      return defaultValue;

    const Value& v = section[name];
    if (!v.IsUint())
      throw EngineConfigurationException(std::string("EngineConfigurationFileReader: '") + name +
					 "' must be a non-negative integer");
    return v.GetUint();
  }

  static ConfidenceBand readBand(const Value& section, const char* name, const ConfidenceBand& defaultBand)
  {
    if (!section.HasMember(name))
      return defaultBand;

    const Value& v = section[name];
    if (!v.IsArray() || v.Size() != 2 || !v[0].IsNumber() || !v[1].IsNumber())
      throw EngineConfigurationException(std::string("EngineConfigurationFileReader: band '") + name +
					 "' must be a [floor, ceiling] pair");
    return ConfidenceBand{v[0].GetDouble(), v[1].GetDouble()};
  }

  static const Value* findSection(const Value& parent, const char* name)
  {
    if (!parent.HasMember(name))
      return nullptr;

    const Value& v = parent[name];
    if (!v.IsObject())
      throw EngineConfigurationException(std::string("EngineConfigurationFileReader: section '") + name +
					 "' must be an object");
    return &v;
  }

  EngineConfigurationFileReader::EngineConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  EngineConfiguration EngineConfigurationFileReader::readConfigurationFile() const
  {
    std::ifstream file(mConfigurationFileName);
    if (!file.is_open())
      throw EngineConfigurationException("EngineConfigurationFileReader: cannot open " + mConfigurationFileName);

    std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseConfiguration(json);
  }

  EngineConfiguration EngineConfigurationFileReader::parseConfiguration(const std::string& json)
  {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
      {
	std::ostringstream msg;
	msg << "EngineConfigurationFileReader: JSON parse error at offset " << doc.GetErrorOffset()
	    << ": " << GetParseError_En(doc.GetParseError());
	throw EngineConfigurationException(msg.str());
      }

    if (!doc.IsObject())
      throw EngineConfigurationException("EngineConfigurationFileReader: top level must be an object");

    HeadcountModelParameters headcount;
    if (const Value* section = findSection(doc, "headcount"))
      {
	headcount.priorWeight = readDouble(*section, "prior_weight", headcount.priorWeight);
	headcount.concentrationScale = readDouble(*section, "concentration_scale", headcount.concentrationScale);
	headcount.minEvidenceThreshold = readDouble(*section, "min_evidence_threshold",
						    headcount.minEvidenceThreshold);
	headcount.monteCarloSamples = readUnsigned(*section, "monte_carlo_samples", headcount.monteCarloSamples);
      }

    SalaryModelParameters salary;
    if (const Value* section = findSection(doc, "salary"))
      {
	salary.priorEffectiveN = readDouble(*section, "prior_effective_n", salary.priorEffectiveN);
	salary.priorCoefficientOfVariation = readDouble(*section, "prior_cv", salary.priorCoefficientOfVariation);
	salary.minPlausibleSalary = readDouble(*section, "min_plausible_salary", salary.minPlausibleSalary);
	salary.maxPlausibleSalary = readDouble(*section, "max_plausible_salary", salary.maxPlausibleSalary);
      }

    ConfidenceParameters confidence;
    if (const Value* section = findSection(doc, "confidence"))
      {
	confidence.evidenceScale = readDouble(*section, "evidence_scale", confidence.evidenceScale);
	confidence.syntheticOverlapDiscount = readDouble(*section, "synthetic_overlap_discount",
							 confidence.syntheticOverlapDiscount);
	confidence.observed = readBand(*section, "observed", confidence.observed);
	confidence.knownEmployerInferred = readBand(*section, "inferred", confidence.knownEmployerInferred);
	confidence.cbpSynthetic = readBand(*section, "synthetic", confidence.cbpSynthetic);
      }

    SourceWeights weights;
    if (const Value* section = findSection(doc, "source_weights"))
      {
	if (const Value* headcountWeights = findSection(*section, "headcount"))
	  {
	    weights.headcount.posting = readDouble(*headcountWeights, "posting", weights.headcount.posting);
	    weights.headcount.visa = readDouble(*headcountWeights, "visa", weights.headcount.visa);
	    weights.headcount.payroll = readDouble(*headcountWeights, "payroll", weights.headcount.payroll);
	  }

	if (const Value* salaryWeights = findSection(*section, "salary"))
	  {
	    weights.salary.payroll = readDouble(*salaryWeights, "payroll", weights.salary.payroll);
	    weights.salary.visaFiling = readDouble(*salaryWeights, "visa", weights.salary.visaFiling);
	    weights.salary.wageTable = readDouble(*salaryWeights, "wage_table", weights.salary.wageTable);
	    weights.salary.atsPosting = readDouble(*salaryWeights, "ats_posting", weights.salary.atsPosting);
	    weights.salary.posting = readDouble(*salaryWeights, "posting", weights.salary.posting);
	  }
      }

    OccupationMix mix;
    if (const Value* section = findSection(doc, "industry_occupation_mix"))
      {
	for (auto it = section->MemberBegin(); it != section->MemberEnd(); ++it)
	  {
	    const std::string industry = it->name.GetString();
	    if (!it->value.IsArray())
	      throw EngineConfigurationException("EngineConfigurationFileReader: mix for industry '" +
						 industry + "' must be an array");

	    std::vector<RoleFraction> roles;
	    for (const auto& entry : it->value.GetArray())
	      {
		if (!entry.IsObject() || !entry.HasMember("canonical_role_id") || !entry.HasMember("fraction") ||
		    !entry["canonical_role_id"].IsInt() || !entry["fraction"].IsNumber())
		  throw EngineConfigurationException("EngineConfigurationFileReader: mix entries for industry '" +
						     industry + "' need integer canonical_role_id and numeric fraction");

		roles.push_back(RoleFraction{entry["canonical_role_id"].GetInt(), entry["fraction"].GetDouble()});
	      }
	    mix.setIndustryMix(industry, std::move(roles));
	  }
      }

    return EngineConfiguration(headcount, salary, confidence, mix, weights);
  }
}

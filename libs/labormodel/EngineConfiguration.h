#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "DomainTypes.h"
#include "LaborModelException.h"

namespace labormodel
{
  struct HeadcountModelParameters
  {
    double priorWeight = 5.0;
    double concentrationScale = 1.0;
    double minEvidenceThreshold = 1.0;
    unsigned int monteCarloSamples = 1000;
  };

  struct SalaryModelParameters
  {
    double priorEffectiveN = 10.0;
    double priorCoefficientOfVariation = 0.25;
    double minPlausibleSalary = 20000.0;
    double maxPlausibleSalary = 1000000.0;
  };

  // Reliability weight of each evidence source type.
  struct HeadcountSourceWeights
  {
    double posting = 0.5;
    double visa = 2.0;
    double payroll = 3.0;
  };

  struct SalarySourceWeights
  {
    double payroll = 5.0;
    double visaFiling = 5.0;
    double wageTable = 4.0;
    double atsPosting = 2.0;
    double posting = 1.5;
  };

  struct SourceWeights
  {
    HeadcountSourceWeights headcount;
    SalarySourceWeights salary;
  };

  struct ConfidenceBand
  {
    double floor;
    double ceiling;
  };

  struct ConfidenceParameters
  {
    ConfidenceBand observed{0.85, 0.95};
    ConfidenceBand knownEmployerInferred{0.20, 0.45};
    ConfidenceBand cbpSynthetic{0.10, 0.20};
    double evidenceScale = 10.0;
    double syntheticOverlapDiscount = 0.9;
  };

  struct RoleFraction
  {
    int canonicalRoleId;
    double fraction;
  };

  /**
   * @class OccupationMix
   * @brief Industry -> share of its employment in each canonical role.
   *
   * Used to split establishment-level employment into roles. Industries
   * without an entry use the "other" entry, if there is one.
   */
  class OccupationMix
  {
  public:
    static constexpr const char* FALLBACK_INDUSTRY = "other";

    OccupationMix() = default;

    void setIndustryMix(const std::string& industry, std::vector<RoleFraction> mix);

    // The mix for industry, falling back to "other". Empty if neither exists.
    const std::vector<RoleFraction>& getMix(const std::string& industry) const;

    bool empty() const
    {
      return mMix.empty();
    }

    const std::map<std::string, std::vector<RoleFraction>>& getAllMixes() const
    {
      return mMix;
    }

  private:
    std::map<std::string, std::vector<RoleFraction>> mMix;
  };

  /**
   * @class EngineConfiguration
   * @brief Immutable tuning parameters shared by every inference component.
   *
   * All parameters are validated on construction; an invalid value raises
   * EngineConfigurationException so that no component ever sees a
   * nonsensical configuration.
   */
  class EngineConfiguration
  {
  public:
    EngineConfiguration();

    EngineConfiguration(const HeadcountModelParameters& headcount,
			const SalaryModelParameters& salary,
			const ConfidenceParameters& confidence,
			const OccupationMix& occupationMix,
			const SourceWeights& sourceWeights = SourceWeights());

    const HeadcountModelParameters& getHeadcountParameters() const
    {
      return mHeadcount;
    }

    const SalaryModelParameters& getSalaryParameters() const
    {
      return mSalary;
    }

    const ConfidenceParameters& getConfidenceParameters() const
    {
      return mConfidence;
    }

    const OccupationMix& getOccupationMix() const
    {
      return mOccupationMix;
    }

    const SourceWeights& getSourceWeights() const
    {
      return mSourceWeights;
    }

    double getHeadcountSourceWeight(HeadcountSourceType type) const;
    double getSalarySourceWeight(SalarySourceType type) const;

    const ConfidenceBand& getConfidenceBand(RecordType type) const;

    // Copy with a different Monte Carlo sample count (command line override).
    EngineConfiguration withMonteCarloSamples(unsigned int samples) const;

  private:
    void validate() const;

    HeadcountModelParameters mHeadcount;
    SalaryModelParameters mSalary;
    ConfidenceParameters mConfidence;
    OccupationMix mOccupationMix;
    SourceWeights mSourceWeights;
  };

  /**
   * @class EngineConfigurationFileReader
   * @brief Reads an EngineConfiguration from a JSON document.
   *
   * Every section and key is optional; anything absent keeps its default.
   * Layout:
   * @code
   * {
   *   "headcount":  { "prior_weight": 5.0, "concentration_scale": 1.0,
   *                   "min_evidence_threshold": 1.0, "monte_carlo_samples": 1000 },
   *   "salary":     { "prior_effective_n": 10.0, "prior_cv": 0.25,
   *                   "min_plausible_salary": 20000, "max_plausible_salary": 1000000 },
   *   "confidence": { "evidence_scale": 10.0, "synthetic_overlap_discount": 0.9,
   *                   "observed": [0.85, 0.95], "inferred": [0.20, 0.45],
   *                   "synthetic": [0.10, 0.20] },
   *   "source_weights": {
   *       "headcount": { "posting": 0.5, "visa": 2.0, "payroll": 3.0 },
   *       "salary":    { "payroll": 5.0, "visa": 5.0, "wage_table": 4.0,
   *                      "ats_posting": 2.0, "posting": 1.5 } },
   *   "industry_occupation_mix": {
   *       "technology": [ { "canonical_role_id": 1, "fraction": 0.35 } ] }
   * }
   * @endcode
   */
  class EngineConfigurationFileReader
  {
  public:
    explicit EngineConfigurationFileReader(const std::string& configurationFileName);

    EngineConfiguration readConfigurationFile() const;

    // Parse from an in-memory JSON string.
    static EngineConfiguration parseConfiguration(const std::string& json);

  private:
    std::string mConfigurationFileName;
  };
}

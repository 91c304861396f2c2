#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "DomainTypes.h"
#include "EngineConfiguration.h"
#include "PriorProvider.h"

namespace labormodel
{
  // Census EMPSZES establishment size class.
  struct SizeClass
  {
    int code;
    long minEmployees;
    long maxEmployees;
    double midpoint;
  };

  // One County Business Patterns row: establishments of an industry and
  // size class within a metro area.
  struct EstablishmentRecord
  {
    std::string metroAreaId;
    std::string naicsCode;
    std::string industry;
    int sizeClass;
    long establishments;
    long employment;
  };

  /**
   * @class SyntheticTierGenerator
   * @brief Builds CbpSynthetic archetypes for employment at establishments
   *        that are not known individually.
   *
   * Each establishment row's employment is split over canonical roles with
   * the configured industry occupation mix; a role share under one head is
   * dropped. Salaries come from the metro x role OEWS prior when there is
   * one. Suppressed employment (reported as zero) is estimated from the
   * establishment count and the size class midpoint.
   *
   * Rows are keyed "cbp:<naics>:<size_class>" so that reruns upsert rather
   * than duplicate.
   */
  class SyntheticTierGenerator
  {
  public:
    SyntheticTierGenerator(const EngineConfiguration& config,
			   const IPriorProvider& priors,
			   int referenceYear)
      : mConfig(config),
	mPriors(priors),
	mReferenceYear(referenceYear)
    {}

    std::vector<Archetype> generate(const std::vector<EstablishmentRecord>& establishments,
				    std::ostream& os) const;

    static std::optional<SizeClass> lookupSizeClass(int code);

    // Larger establishments are better covered by public data.
    static double syntheticConfidence(const SizeClass& sizeClass);

    static std::string syntheticCompanyId(const EstablishmentRecord& record);

  private:
    const EngineConfiguration& mConfig;
    const IPriorProvider& mPriors;
    int mReferenceYear;
  };
}

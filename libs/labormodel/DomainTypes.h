#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>

namespace labormodel
{
  enum class HeadcountSourceType
    {
      Posting,
      Visa,
      Payroll
    };

  enum class SalarySourceType
    {
      Payroll,
      VisaFiling,
      NegotiatedWageTable,
      AtsPosting,
      Posting
    };

  enum class RecordType
    {
      Observed,
      KnownEmployerInferred,
      CbpSynthetic
    };

  enum class Seniority
    {
      Intern,
      Entry,
      Mid,
      Senior,
      Lead,
      Manager,
      Director,
      Executive
    };

  enum class EstimationMethod
    {
      DirichletShrinkage,
      BayesianShrinkage
    };

  std::string toString(HeadcountSourceType type);
  std::string toString(SalarySourceType type);
  std::string toString(RecordType type);
  std::string toString(Seniority seniority);
  std::string toString(EstimationMethod method);

  /**
   * @brief Parse the lower-case names used in input files.
   * @throws std::invalid_argument for an unknown name.
   */
  HeadcountSourceType parseHeadcountSourceType(const std::string& name);
  SalarySourceType parseSalarySourceType(const std::string& name);
  RecordType parseRecordType(const std::string& name);
  Seniority parseSeniority(const std::string& name);

  /**
   * @class MetroRoleKey
   * @brief Identifies one labor-market cell: an OEWS metro area code and a
   *        canonical job role.
   */
  class MetroRoleKey
  {
  public:
    MetroRoleKey(const std::string& metroAreaId, int canonicalRoleId)
      : mMetroAreaId(metroAreaId),
	mCanonicalRoleId(canonicalRoleId)
    {}

    const std::string& getMetroAreaId() const
    {
      return mMetroAreaId;
    }

    int getCanonicalRoleId() const
    {
      return mCanonicalRoleId;
    }

    std::string toString() const
    {
      return mMetroAreaId + "/" + std::to_string(mCanonicalRoleId);
    }

    bool operator==(const MetroRoleKey& rhs) const
    {
      return mCanonicalRoleId == rhs.mCanonicalRoleId && mMetroAreaId == rhs.mMetroAreaId;
    }

    bool operator!=(const MetroRoleKey& rhs) const
    {
      return !(*this == rhs);
    }

    bool operator<(const MetroRoleKey& rhs) const
    {
      return std::tie(mMetroAreaId, mCanonicalRoleId) <
	std::tie(rhs.mMetroAreaId, rhs.mCanonicalRoleId);
    }

  private:
    std::string mMetroAreaId;
    int mCanonicalRoleId;
  };

  std::ostream& operator<<(std::ostream& os, const MetroRoleKey& key);

  /**
   * @class OEWSPrior
   * @brief Macro employment and wage percentiles for one cell and reference year.
   */
  class OEWSPrior
  {
  public:
    OEWSPrior(const MetroRoleKey& key,
	      int referenceYear,
	      long employmentTotal,
	      double wageP10,
	      double wageP25,
	      double wageP50,
	      double wageP75,
	      double wageP90,
	      double wageMean)
      : mKey(key),
	mReferenceYear(referenceYear),
	mEmploymentTotal(employmentTotal),
	mWageP10(wageP10),
	mWageP25(wageP25),
	mWageP50(wageP50),
	mWageP75(wageP75),
	mWageP90(wageP90),
	mWageMean(wageMean)
    {}

    const MetroRoleKey& getKey() const { return mKey; }
    int getReferenceYear() const { return mReferenceYear; }
    long getEmploymentTotal() const { return mEmploymentTotal; }
    double getWageP10() const { return mWageP10; }
    double getWageP25() const { return mWageP25; }
    double getWageP50() const { return mWageP50; }
    double getWageP75() const { return mWageP75; }
    double getWageP90() const { return mWageP90; }
    double getWageMean() const { return mWageMean; }

  private:
    MetroRoleKey mKey;
    int mReferenceYear;
    long mEmploymentTotal;
    double mWageP10;
    double mWageP25;
    double mWageP50;
    double mWageP75;
    double mWageP90;
    double mWageMean;
  };

  // One raw headcount signal (a posting count, a visa filing count...)
  struct HeadcountEvidenceRecord
  {
    std::string companyId;
    HeadcountSourceType sourceType;
    long count;
  };

  /**
   * @class CompanyEvidence
   * @brief Per-company headcount evidence for a cell after weighting.
   *
   * totalWeightedEvidence sums the counts, each scaled by its source weight.
   * evidenceShare is this company's fraction of the cell's weighted evidence.
   */
  class CompanyEvidence
  {
  public:
    CompanyEvidence(const std::string& companyId,
		    long postingCount,
		    long visaCount,
		    long payrollCount,
		    double totalWeightedEvidence,
		    double evidenceShare)
      : mCompanyId(companyId),
	mPostingCount(postingCount),
	mVisaCount(visaCount),
	mPayrollCount(payrollCount),
	mTotalWeightedEvidence(totalWeightedEvidence),
	mEvidenceShare(evidenceShare)
    {}

    const std::string& getCompanyId() const { return mCompanyId; }
    long getPostingCount() const { return mPostingCount; }
    long getVisaCount() const { return mVisaCount; }
    long getPayrollCount() const { return mPayrollCount; }
    double getTotalWeightedEvidence() const { return mTotalWeightedEvidence; }
    double getEvidenceShare() const { return mEvidenceShare; }

  private:
    std::string mCompanyId;
    long mPostingCount;
    long mVisaCount;
    long mPayrollCount;
    double mTotalWeightedEvidence;
    double mEvidenceShare;
  };

  /**
   * @class SalaryObservation
   * @brief A single salary data point for a company in a cell.
   *
   * At least one of min, max or point is expected; an observation with none
   * of them is degenerate and carries no information.
   */
  class SalaryObservation
  {
  public:
    SalaryObservation(const std::string& companyId,
		      SalarySourceType sourceType,
		      std::optional<double> salaryMin,
		      std::optional<double> salaryMax,
		      std::optional<double> salaryPoint)
      : mCompanyId(companyId),
	mSourceType(sourceType),
	mSalaryMin(salaryMin),
	mSalaryMax(salaryMax),
	mSalaryPoint(salaryPoint)
    {}

    const std::string& getCompanyId() const { return mCompanyId; }
    SalarySourceType getSourceType() const { return mSourceType; }
    const std::optional<double>& getSalaryMin() const { return mSalaryMin; }
    const std::optional<double>& getSalaryMax() const { return mSalaryMax; }
    const std::optional<double>& getSalaryPoint() const { return mSalaryPoint; }

    bool isDegenerate() const
    {
      return !mSalaryMin && !mSalaryMax && !mSalaryPoint;
    }

  private:
    std::string mCompanyId;
    SalarySourceType mSourceType;
    std::optional<double> mSalaryMin;
    std::optional<double> mSalaryMax;
    std::optional<double> mSalaryPoint;
  };

  /**
   * @class HeadcountEstimate
   * @brief Allocated headcount for one company in one cell.
   *
   * Invariant: p10 <= p50 <= p90, and p50 summed over a cell equals the
   * cell's employment total.
   */
  class HeadcountEstimate
  {
  public:
    HeadcountEstimate(const std::string& companyId,
		      const MetroRoleKey& key,
		      long p10,
		      long p50,
		      long p90,
		      double evidenceScore,
		      double shareOfMetro,
		      long employmentTotal,
		      std::size_t companiesInCell)
      : mCompanyId(companyId),
	mKey(key),
	mP10(p10),
	mP50(p50),
	mP90(p90),
	mEvidenceScore(evidenceScore),
	mShareOfMetro(shareOfMetro),
	mEmploymentTotal(employmentTotal),
	mCompaniesInCell(companiesInCell)
    {}

    const std::string& getCompanyId() const { return mCompanyId; }
    const MetroRoleKey& getKey() const { return mKey; }
    long getP10() const { return mP10; }
    long getP50() const { return mP50; }
    long getP90() const { return mP90; }
    double getEvidenceScore() const { return mEvidenceScore; }
    double getShareOfMetro() const { return mShareOfMetro; }
    long getEmploymentTotal() const { return mEmploymentTotal; }
    std::size_t getCompaniesInCell() const { return mCompaniesInCell; }

    EstimationMethod getMethod() const
    {
      return EstimationMethod::DirichletShrinkage;
    }

  private:
    std::string mCompanyId;
    MetroRoleKey mKey;
    long mP10;
    long mP50;
    long mP90;
    double mEvidenceScore;
    double mShareOfMetro;
    long mEmploymentTotal;
    std::size_t mCompaniesInCell;
  };

  // Wage percentiles of a salary distribution, in dollars per year.
  struct WagePercentiles
  {
    double p10;
    double p25;
    double p50;
    double p75;
    double p90;
  };

  /**
   * @class SalaryEstimate
   * @brief Posterior wage distribution for one company in one cell.
   */
  class SalaryEstimate
  {
  public:
    SalaryEstimate(const std::string& companyId,
		   const MetroRoleKey& key,
		   const WagePercentiles& percentiles,
		   double mean,
		   double stdDev,
		   std::size_t observationCount,
		   double effectiveSampleSize,
		   double shrinkageFactor,
		   double oewsMedian)
      : mCompanyId(companyId),
	mKey(key),
	mPercentiles(percentiles),
	mMean(mean),
	mStdDev(stdDev),
	mObservationCount(observationCount),
	mEffectiveSampleSize(effectiveSampleSize),
	mShrinkageFactor(shrinkageFactor),
	mOewsMedian(oewsMedian)
    {}

    const std::string& getCompanyId() const { return mCompanyId; }
    const MetroRoleKey& getKey() const { return mKey; }
    const WagePercentiles& getPercentiles() const { return mPercentiles; }
    double getP10() const { return mPercentiles.p10; }
    double getP25() const { return mPercentiles.p25; }
    double getP50() const { return mPercentiles.p50; }
    double getP75() const { return mPercentiles.p75; }
    double getP90() const { return mPercentiles.p90; }
    double getMean() const { return mMean; }
    double getStdDev() const { return mStdDev; }
    std::size_t getObservationCount() const { return mObservationCount; }
    double getEffectiveSampleSize() const { return mEffectiveSampleSize; }
    double getShrinkageFactor() const { return mShrinkageFactor; }
    double getOewsMedian() const { return mOewsMedian; }

    EstimationMethod getMethod() const
    {
      return EstimationMethod::BayesianShrinkage;
    }

  private:
    std::string mCompanyId;
    MetroRoleKey mKey;
    WagePercentiles mPercentiles;
    double mMean;
    double mStdDev;
    std::size_t mObservationCount;
    double mEffectiveSampleSize;
    double mShrinkageFactor;
    double mOewsMedian;
  };

  // Natural key of an archetype row.
  struct ArchetypeKey
  {
    std::string companyId;
    std::string metroAreaId;
    int canonicalRoleId;
    Seniority seniority;
    RecordType recordType;

    bool operator<(const ArchetypeKey& rhs) const
    {
      return std::tie(companyId, metroAreaId, canonicalRoleId, seniority, recordType) <
	std::tie(rhs.companyId, rhs.metroAreaId, rhs.canonicalRoleId, rhs.seniority, rhs.recordType);
    }

    bool operator==(const ArchetypeKey& rhs) const
    {
      return std::tie(companyId, metroAreaId, canonicalRoleId, seniority, recordType) ==
	std::tie(rhs.companyId, rhs.metroAreaId, rhs.canonicalRoleId, rhs.seniority, rhs.recordType);
    }
  };

  /**
   * @class Archetype
   * @brief A (company, cell, seniority) row in one of the three tiers.
   *
   * Immutable. The reconciler produces adjusted copies through
   * withAdjustedHeadcount().
   */
  class Archetype
  {
  public:
    Archetype(const std::string& companyId,
	      const MetroRoleKey& key,
	      Seniority seniority,
	      RecordType recordType,
	      const std::string& industry,
	      long headcountP10,
	      long headcountP50,
	      long headcountP90,
	      std::optional<double> salaryP25,
	      std::optional<double> salaryP50,
	      std::optional<double> salaryP75,
	      double compositeConfidence)
      : mCompanyId(companyId),
	mKey(key),
	mSeniority(seniority),
	mRecordType(recordType),
	mIndustry(industry),
	mHeadcountP10(headcountP10),
	mHeadcountP50(headcountP50),
	mHeadcountP90(headcountP90),
	mSalaryP25(salaryP25),
	mSalaryP50(salaryP50),
	mSalaryP75(salaryP75),
	mCompositeConfidence(compositeConfidence)
    {}

    const std::string& getCompanyId() const { return mCompanyId; }
    const MetroRoleKey& getKey() const { return mKey; }
    Seniority getSeniority() const { return mSeniority; }
    RecordType getRecordType() const { return mRecordType; }
    const std::string& getIndustry() const { return mIndustry; }
    long getHeadcountP10() const { return mHeadcountP10; }
    long getHeadcountP50() const { return mHeadcountP50; }
    long getHeadcountP90() const { return mHeadcountP90; }
    const std::optional<double>& getSalaryP25() const { return mSalaryP25; }
    const std::optional<double>& getSalaryP50() const { return mSalaryP50; }
    const std::optional<double>& getSalaryP75() const { return mSalaryP75; }
    double getCompositeConfidence() const { return mCompositeConfidence; }

    ArchetypeKey getNaturalKey() const
    {
      return ArchetypeKey{mCompanyId, mKey.getMetroAreaId(), mKey.getCanonicalRoleId(),
	  mSeniority, mRecordType};
    }

    Archetype withAdjustedHeadcount(long p10, long p50, long p90, double confidence) const
    {
      return Archetype(mCompanyId, mKey, mSeniority, mRecordType, mIndustry,
		       p10, p50, p90, mSalaryP25, mSalaryP50, mSalaryP75, confidence);
    }

  private:
    std::string mCompanyId;
    MetroRoleKey mKey;
    Seniority mSeniority;
    RecordType mRecordType;
    std::string mIndustry;
    long mHeadcountP10;
    long mHeadcountP50;
    long mHeadcountP90;
    std::optional<double> mSalaryP25;
    std::optional<double> mSalaryP50;
    std::optional<double> mSalaryP75;
    double mCompositeConfidence;
  };
}

namespace std
{
  template <>
  struct hash<labormodel::MetroRoleKey>
  {
    std::size_t operator()(const labormodel::MetroRoleKey& key) const noexcept
    {
      const std::size_t h1 = std::hash<std::string>{}(key.getMetroAreaId());
      const std::size_t h2 = std::hash<int>{}(key.getCanonicalRoleId());
      return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
    }
  };
}

/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  AnalysisRun.h
  ------------------------------------------------------------------
  Batch design flood analysis: every combination of Tc method,
  storm code, return period, X factor and runoff method
  ----------------------------------------------------------------*/
#ifndef ANALYSISRUN_H
#define ANALYSISRUN_H

#include "PluvialInclude.h"
#include "TimeOfConcentration.h"
#include "CoefficientTables.h"
#include "StormDesign.h"
#include "RainfallExcess.h"
#include "UnitHydrograph.h"
#include <nlohmann/json.hpp>

///////////////////////////////////////////////////////////////////
/// \brief watershed descriptors
/// \details unspecified values are PLV_BLANK_DATA
//
struct basin_params
{
  string   name;                     ///< basin name
  double   area_ha;                  ///< drainage area [ha]
  double   slope_pct;                ///< mean slope [%]
  double   length_m;                 ///< main flow path length [m]
  double   elevation_drop_m;         ///< elevation drop along flow path [m]
  double   P3_10;                    ///< DINAGUA 3-hr, 10-yr reference depth [mm]
  double   C;                        ///< runoff coefficient at Tr=2 yr [-]
  double   CN;                       ///< curve number (AMC II) [-]
  string   soil_group;               ///< hydrologic soil group (A-D) for CN tables

  coeff_table           c_table;     ///< table used by C coverage items
  vector<coverage_item> c_coverage;  ///< area-weighted C coverage (may be empty)
  vector<coverage_item> cn_coverage; ///< area-weighted CN coverage (may be empty)

  basin_params();
};

///////////////////////////////////////////////////////////////////
/// \brief method selection and analysis settings
//
struct analysis_options
{
  vector<string> tc_methods;     ///< Tc method tags
  vector<string> storm_codes;    ///< storm code tags
  vector<double> return_periods; ///< return periods [yr]
  vector<double> x_factors;      ///< X factors (used with gz storm only)
  vector<string> runoff_methods; ///< runoff method tags (empty: all methods with available coefficient)
  double         dt_min;         ///< time step [min]
  amc_type       amc;            ///< antecedent moisture condition
  double         lambda;         ///< SCS initial abstraction ratio
  tc_params      tc;             ///< additional Tc inputs (surface, segments, t0, kinematic values)
  storm_params   storm;          ///< bimodal/custom storm settings
  string         uh_tag;         ///< unit hydrograph for runs without the X-factor UH (empty: scs_triangular)
  unit_hydrograph_params uh;     ///< unit hydrograph parameters (PRF, gamma shape, Snyder, Clark)

  analysis_options();
};

///////////////////////////////////////////////////////////////////
/// \brief result of a single analysis combination
//
struct analysis_run
{
  tc_result         tc;            ///< time of concentration used (recomputed for Desbordes)
  hyetograph_result storm;         ///< design storm
  hydrograph_result hydrograph;    ///< direct runoff hydrograph
  runoff_method     runoff;        ///< runoff method
  double            C_used;        ///< effective C (rational) or PLV_BLANK_DATA
  double            CN_used;       ///< adjusted CN (SCS) or PLV_BLANK_DATA
  amc_type          amc;           ///< antecedent moisture condition
  double            duration_hr;   ///< storm duration [hr]
};

///////////////////////////////////////////////////////////////////
/// \brief evaluates the full product of analysis combinations for one basin
//
class CAnalysisRunner
{
private:/*------------------------------------------------------*/
  basin_params                 _basin;      ///< watershed descriptors
  analysis_options             _options;    ///< method selection
  const CDistributionRegistry *_pRegistry;  ///< reference distributions (not owned)

  vector<tc_result>            _aTcResults; ///< Tc by method
  vector<analysis_run>         _aRuns;      ///< completed analyses
  int                          _nSkipped;   ///< number of skipped combinations

  tc_params GetTcParams       () const;
  double    GetCForTr         (const double &Tr) const;
  void      CalculateTcResults();
  bool      RunSingleAnalysis (const tc_result &tc, const string storm_tag, const double &Tr,
                               const double &X, const runoff_method method);

public:/*-------------------------------------------------------*/
  CAnalysisRunner(const basin_params &basin, const analysis_options &options, const CDistributionRegistry &Registry);
  ~CAnalysisRunner();

  void                 Run               ();

  int                  GetNumTcResults   () const;
  const tc_result     &GetTcResult       (const int i) const;
  int                  GetNumRuns        () const;
  const analysis_run  &GetRun            (const int i) const;
  int                  GetNumSkipped     () const;
  int                  GetMaxPeakRunIndex() const;
};

nlohmann::json AnalysisRunToJSON  (const analysis_run &run);
void           WriteAnalysesJSON  (const string filename, const CAnalysisRunner &Runner);
void           WriteSummaryCSV    (const string filename, const CAnalysisRunner &Runner);
void           WriteHydrographCSV (const string filename, const analysis_run &run);

#endif

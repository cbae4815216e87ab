/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  StormDesign.h
  ------------------------------------------------------------------
  Design storm codes: duration/time step policy and generator dispatch
  ----------------------------------------------------------------*/
#ifndef STORMDESIGN_H
#define STORMDESIGN_H

#include "PluvialInclude.h"
#include "Hyetograph.h"

///////////////////////////////////////////////////////////////////
/// \brief design storm codes used by the analysis runner
//
enum storm_code
{
  STORM_GZ,        ///< 6-hr DINAGUA alternating blocks, peak at 1/6 of duration
  STORM_BLOCKS,    ///< DINAGUA alternating blocks, duration max(Tc,1 hr)
  STORM_BLOCKS24,  ///< 24-hr DINAGUA alternating blocks
  STORM_SCS_II,    ///< 24-hr SCS type II with DINAGUA total
  STORM_HUFF,      ///< Huff quartile (huff_qN) with DINAGUA total
  STORM_BIMODAL,   ///< bimodal DINAGUA
  STORM_CUSTOM     ///< user-specified storm
};

///////////////////////////////////////////////////////////////////
/// \brief parameters of the configurable storm codes
//
struct storm_params
{
  double         bimodal_peak1;        ///< relative time of first peak [-]
  double         bimodal_peak2;        ///< relative time of second peak [-]
  double         bimodal_volume_split; ///< fraction of depth in first peak [-]
  double         bimodal_peak_width;   ///< relative half-width of each peak [-]
  double         bimodal_duration_hr;  ///< bimodal storm duration [hr]

  double         custom_depth_mm;      ///< custom storm total depth [mm] (or PLV_BLANK_DATA)
  string         custom_distribution;  ///< temporal pattern of custom depth storm
  double         custom_duration_hr;   ///< custom storm duration [hr]
  vector<double> custom_time_min;      ///< observed event times [min] (may be empty)
  vector<double> custom_depth_series;  ///< observed event depths [mm] (may be empty)

  storm_params();
};

storm_code        StringToStormCode     (const string s);
string            StormCodeToString     (const storm_code code);
int               GetHuffQuartileFromCode(const string s);

void              GetStormDurationAndDt (const string storm_tag, const double &tc_hr, const double &dt_min,
                                         const storm_params &SP, double &duration_hr, double &dt_used);
hyetograph_result GenerateDesignStorm   (const string storm_tag, const double &P3_10, const double &Tr,
                                         const double &duration_hr, const double &dt_min,
                                         const storm_params &SP, const CDistributionRegistry &Registry);

#endif

/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  Hyetograph.h
  ------------------------------------------------------------------
  Design storm (hyetograph) generators
  ----------------------------------------------------------------*/
#ifndef HYETOGRAPH_H
#define HYETOGRAPH_H

#include "PluvialInclude.h"
#include "IDFCurves.h"
#include "DistributionRegistry.h"

///////////////////////////////////////////////////////////////////
/// \brief rainfall hyetograph on a uniform time step
//
struct hyetograph_result
{
  vector<double> time_min;            ///< interval centres [min]
  vector<double> depth_mm;            ///< incremental depth in each interval [mm]
  vector<double> intensity_mmhr;      ///< mean intensity in each interval [mm/hr]
  vector<double> cumulative_mm;       ///< cumulative depth at end of each interval [mm]
  double         total_depth_mm;      ///< sum of depths [mm]
  double         peak_intensity_mmhr; ///< maximum intensity [mm/hr]
  double         dt_min;              ///< time step [min]
  string         method;              ///< generator tag
};

int               NumStormIntervals          (const double &duration_hr, const double &dt_min);
vector<double>    DistributeAlternatingBlocks(const vector<double> &sorted_increments, const int nIntervals, const double &peak_position);

hyetograph_result AlternatingBlocks          (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const CIDFCurve &IDF, const double &Tr, const double &peak_position=0.5);
hyetograph_result AlternatingBlocksDinagua   (const double &P3_10, const double &Tr, const double &duration_hr, const double &dt_min,
                                              const double &area_km2=PLV_BLANK_DATA, const double &peak_position=0.5);
hyetograph_result ChicagoStorm               (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const CIDFCurve &IDF, const double &Tr, const double &r=DEFAULT_CHICAGO_R);
hyetograph_result SCSDistribution            (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const scs_storm_type type, const CDistributionRegistry &Registry);
hyetograph_result HuffDistribution           (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const int quartile, const int probability, const CDistributionRegistry &Registry);
hyetograph_result BimodalStorm               (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const double &peak1=0.25, const double &peak2=0.75,
                                              const double &volume_split=0.5, const double &peak_width=0.15);
hyetograph_result BimodalDinagua             (const double &P3_10, const double &Tr, const double &duration_hr=6.0, const double &dt_min=5.0,
                                              const double &area_km2=PLV_BLANK_DATA,
                                              const double &peak1=0.25, const double &peak2=0.75,
                                              const double &volume_split=0.5, const double &peak_width=0.15);
hyetograph_result BimodalChicago             (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const CIDFCurve &IDF, const double &Tr,
                                              const double &peak1=0.25, const double &peak2=0.75, const double &volume_split=0.5);
hyetograph_result CustomDepthStorm           (const double &total_depth_mm, const double &duration_hr, const double &dt_min,
                                              const string distribution, const CDistributionRegistry &Registry,
                                              const double &peak_position=0.5, const int huff_quartile=2);
hyetograph_result CustomHyetograph           (const vector<double> &time_min, const vector<double> &depth_mm);

#endif

/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  RainfallExcess.h
  ------------------------------------------------------------------
  Rainfall excess (effective rainfall) by the rational and
  SCS curve number methods
  ----------------------------------------------------------------*/
#ifndef RAINFALLEXCESS_H
#define RAINFALLEXCESS_H

#include "PluvialInclude.h"
#include "Hyetograph.h"
#include "CoefficientTables.h"

///////////////////////////////////////////////////////////////////
/// \brief runoff (loss) methods
//
enum runoff_method
{
  RUNOFF_RATIONAL, ///< excess = C * rainfall
  RUNOFF_SCS_CN    ///< SCS curve number method
};

///////////////////////////////////////////////////////////////////
/// \brief rainfall excess series
/// \note available==false if the coefficient needed by the method is missing;
///       in that case, no other member is meaningful
//
struct excess_result
{
  bool           available;   ///< true if excess could be computed
  runoff_method  method;      ///< runoff method used
  vector<double> excess_mm;   ///< incremental rainfall excess [mm]
  double         runoff_mm;   ///< total runoff depth [mm]
  double         C_used;      ///< runoff coefficient (rational only)
  double         CN_used;     ///< AMC-adjusted curve number (SCS only)
  double         S_mm;        ///< potential maximum retention [mm] (SCS only)
  double         Ia_mm;       ///< initial abstraction [mm] (SCS only)
  amc_type       amc;         ///< antecedent moisture condition (SCS only)
  double         lambda;      ///< initial abstraction ratio (SCS only)
};

///////////////////////////////////////////////////////////////////
/// \brief single-event SCS-CN runoff summary
//
struct scs_runoff_result
{
  double rainfall_mm; ///< storm depth [mm]
  double runoff_mm;   ///< runoff depth [mm]
  double Ia_mm;       ///< initial abstraction [mm]
  double S_mm;        ///< potential maximum retention [mm]
  double CN_used;     ///< AMC-adjusted curve number
};

runoff_method     StringToRunoffMethod   (const string s);
string            RunoffMethodToString   (const runoff_method method);

double            SCSRetention           (const double &CN);
double            SCSInitialAbstraction  (const double &S_mm, const double &lambda=DEFAULT_LAMBDA);
double            SCSRunoff              (const double &P_mm, const double &CN, const double &lambda=DEFAULT_LAMBDA);
scs_runoff_result CalculateSCSRunoff     (const double &P_mm, const double &CN, const amc_type amc=AMC_II, const double &lambda=DEFAULT_LAMBDA);
vector<double>    SCSExcessSeries        (const vector<double> &cumulative_mm, const double &CN, const double &lambda=DEFAULT_LAMBDA);
double            GetMinimumInfiltrationRate(const string soil_group);

excess_result     RationalExcess         (const hyetograph_result &H, const double &C);
excess_result     SCSExcess              (const hyetograph_result &H, const double &CN, const amc_type amc=AMC_II, const double &lambda=DEFAULT_LAMBDA);
excess_result     CalculateRainfallExcess(const runoff_method method, const hyetograph_result &H,
                                          const double &C, const double &CN, const amc_type amc, const double &lambda);

double            RationalFrequencyFactor(const double &Tr);
double            RationalPeakFlow       (const double &C, const double &intensity_mmhr, const double &area_ha, const double &Tr=10.0);

#endif

/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  TimeOfConcentration.h
  ------------------------------------------------------------------
  Empirical and hydraulic estimators of basin time of concentration
  ----------------------------------------------------------------*/
#ifndef TIMEOFCONCENTRATION_H
#define TIMEOFCONCENTRATION_H

#include "PluvialInclude.h"
#include "IDFCurves.h"

///////////////////////////////////////////////////////////////////
/// \brief time of concentration estimation methods
//
enum tc_method
{
  TC_KIRPICH,     ///< Kirpich (1940)
  TC_NRCS,        ///< NRCS TR-55 velocity method
  TC_TEMEZ,       ///< Temez
  TC_CALIFORNIA,  ///< California Culverts Practice
  TC_FAA,         ///< Federal Aviation Administration
  TC_KINEMATIC,   ///< kinematic wave (iterative)
  TC_DESBORDES    ///< Desbordes (DINAGUA urban drainage manual)
};

///////////////////////////////////////////////////////////////////
/// \brief NRCS flow segment types
//
enum segment_type
{
  SEGMENT_SHEET,    ///< sheet (overland) flow, L<=100 m
  SEGMENT_SHALLOW,  ///< shallow concentrated flow
  SEGMENT_CHANNEL   ///< open channel flow (Manning)
};

///////////////////////////////////////////////////////////////////
/// \brief surfaces for NRCS shallow concentrated flow
//
enum shallow_surface
{
  SURFACE_PAVED,       ///< k=6.196 m/s
  SURFACE_UNPAVED,     ///< k=4.918 m/s
  SURFACE_GRASSED,     ///< k=4.572 m/s
  SURFACE_SHORT_GRASS  ///< k=2.134 m/s
};

///////////////////////////////////////////////////////////////////
/// \brief single segment of an NRCS flow path
/// \details fields not used by the segment type are ignored
//
struct nrcs_segment
{
  segment_type    type;
  double          length_m;      ///< segment length [m]
  double          slope;         ///< segment slope [m/m]
  double          mannings_n;    ///< Manning's n [-] (sheet, channel)
  double          P2_mm;         ///< 2-yr, 24-hr rainfall [mm] (sheet); PLV_BLANK_DATA uses method default
  shallow_surface surface;       ///< surface type (shallow)
  double          hyd_radius_m;  ///< hydraulic radius [m] (channel)
};

nrcs_segment SheetFlowSegment  (const double &length_m, const double &n, const double &slope, const double &P2_mm=PLV_BLANK_DATA);
nrcs_segment ShallowFlowSegment(const double &length_m, const double &slope, const shallow_surface surface=SURFACE_UNPAVED);
nrcs_segment ChannelFlowSegment(const double &length_m, const double &n, const double &slope, const double &hyd_radius_m);

///////////////////////////////////////////////////////////////////
/// \brief inputs to time of concentration dispatcher
/// \details unspecified values are PLV_BLANK_DATA
//
struct tc_params
{
  double length_m;               ///< flow path length [m]
  double length_km;              ///< flow path length [km]
  double slope;                  ///< slope [m/m]
  double slope_pct;              ///< slope [%]
  double elev_drop_m;            ///< elevation difference along flow path [m]
  string kirpich_surface;        ///< Kirpich surface adjustment type
  bool   has_segments;           ///< true if NRCS segments were supplied (may be empty)
  vector<nrcs_segment> segments; ///< NRCS flow segments
  double P2_mm;                  ///< default NRCS 2-yr, 24-hr rainfall [mm]
  double C;                      ///< runoff coefficient [-]
  double mannings_n;             ///< Manning's n for kinematic wave [-]
  double intensity_mmhr;         ///< design intensity for kinematic wave [mm/hr]
  double area_ha;                ///< basin area [ha]
  double t0_min;                 ///< inlet time for Desbordes [min]
  int    max_iter;               ///< kinematic wave maximum iterations
  double tol_hr;                 ///< kinematic wave convergence tolerance [hr]
  const CIDFCurve *pIDF;         ///< optional IDF curve for kinematic intensity update (not owned)
  double Tr;                     ///< return period for kinematic intensity update [yr]

  tc_params();
};

///////////////////////////////////////////////////////////////////
/// \brief result of time of concentration calculation
//
struct tc_result
{
  tc_method           method;  ///< estimation method
  double              tc_hr;   ///< time of concentration [hr]
  map<string,double>  params;  ///< parameters used in the estimate
};

//individual estimators; all return hours
double    TcKirpich         (const double &length_m, const double &slope, const string surface="natural");
double    TcTemez           (const double &length_km, const double &slope);
double    TcCalifornia      (const double &length_km, const double &elev_drop_m);
double    TcFAA             (const double &length_m, const double &slope_pct, const double &C);
double    TcDesbordes       (const double &area_ha, const double &slope_pct, const double &C, const double &t0_min=DEFAULT_INLET_TIME);
double    TcKinematicWave   (const double &length_m, const double &n, const double &slope, const double &intensity_mmhr,
                             const int max_iter=KINEMATIC_MAX_ITER, const double &tol_hr=KINEMATIC_TOL,
                             const CIDFCurve *pIDF=NULL, const double &Tr=PLV_BLANK_DATA);

//NRCS velocity method
double    NRCSSheetFlowTime    (const double &length_m, const double &n, const double &slope, const double &P2_mm);
double    NRCSShallowFlowTime  (const double &length_m, const double &slope, const shallow_surface surface);
double    NRCSChannelFlowTime  (const double &length_m, const double &n, const double &slope, const double &hyd_radius_m);
double    NRCSSegmentTravelTime(const nrcs_segment &seg, const double &P2_default);
double    NRCSVelocityMethod   (const vector<nrcs_segment> &segments, const double &P2_mm=DEFAULT_NRCS_P2);
double    GetSheetFlowMannings (const string cover);
shallow_surface StringToShallowSurface(const string s);

//dispatcher
tc_result CalculateTc       (const tc_method method, const tc_params &P);
tc_method StringToTcMethod  (const string s);
string    TcMethodToString  (const tc_method method);

#endif

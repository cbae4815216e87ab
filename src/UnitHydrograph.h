/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  UnitHydrograph.h
  ------------------------------------------------------------------
  Synthetic unit hydrographs and discrete convolution
  ----------------------------------------------------------------*/
#ifndef UNITHYDROGRAPH_H
#define UNITHYDROGRAPH_H

#include "PluvialInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief synthetic unit hydrograph methods
//
enum uh_method
{
  UH_TRIANGULAR_X,     ///< triangular with morphological factor X
  UH_SCS_TRIANGULAR,   ///< SCS triangular (Tb=2.67Tp)
  UH_SCS_CURVILINEAR,  ///< SCS dimensionless curvilinear
  UH_GAMMA,            ///< gamma-function shape
  UH_SNYDER,           ///< Snyder (1938)
  UH_CLARK             ///< Clark time-area with linear reservoir
};

///////////////////////////////////////////////////////////////////
/// \brief unit hydrograph (response to 1 mm of excess over one time step)
/// \details ordinates are spaced at dt, start and end at zero and hold exactly 1 mm over the basin
//
struct unit_hydrograph
{
  uh_method      method;   ///< generating method
  vector<double> time_hr;  ///< ordinate times, k*dt [hr]
  vector<double> flow_m3s; ///< ordinates [m3/s per mm]
  double         tp_hr;    ///< time to peak [hr]
  double         tb_hr;    ///< time base [hr]
  double         qp_m3s;   ///< peak rate of the continuous hydrograph [m3/s per mm]
  double         x_factor; ///< recession/rise ratio
};

///////////////////////////////////////////////////////////////////
/// \brief inputs to unit hydrograph generation
/// \details method-specific values that are not needed may stay blank
//
struct unit_hydrograph_params
{
  double area_km2;   ///< basin area [km2]
  double tc_hr;      ///< time of concentration [hr]
  double dt_hr;      ///< time step [hr]
  double X;          ///< triangular X factor [-]
  double prf;        ///< SCS peak rate factor (484 standard) [-]
  double gamma_m;    ///< gamma shape parameter [-]
  double length_km;  ///< Snyder main channel length [km]
  double lc_km;      ///< Snyder distance from outlet to centroid [km]
  double Ct;         ///< Snyder lag coefficient [-]
  double Cp;         ///< Snyder peak coefficient [-]
  double R_hr;       ///< Clark storage coefficient [hr] (blank: 2 Tc)

  unit_hydrograph_params();
};

///////////////////////////////////////////////////////////////////
/// \brief direct runoff hydrograph and its identifiers
//
struct hydrograph_result
{
  vector<double> time_hr;          ///< time [hr]
  vector<double> flow_m3s;         ///< discharge [m3/s]
  double         peak_flow_m3s;    ///< peak discharge [m3/s]
  double         time_to_peak_hr;  ///< time of peak discharge [hr]
  double         tp_unit_hr;       ///< unit hydrograph time to peak [hr]
  double         tb_hr;            ///< unit hydrograph time base [hr]
  double         volume_m3;        ///< runoff volume [m3]
  double         runoff_mm;        ///< runoff depth [mm]
  double         total_depth_mm;   ///< storm depth [mm]
  double         x_factor;         ///< unit hydrograph X factor
  string         uh_tag;           ///< unit hydrograph method tag

  string         tc_method;        ///< time of concentration method tag
  double         tc_min;           ///< time of concentration [min]
  string         storm_code;       ///< storm code tag
  double         return_period;    ///< return period [yr]
};

double          SCSLagTime      (const double &tc_hr);
double          SCSTimeToPeak   (const double &tc_hr, const double &dt_hr);
double          SCSTimeBase     (const double &tp_hr);
double          RecommendedDt   (const double &tc_hr, const string storm_tag="", const double &min_dt_min=5.0);

double          SnyderLagTime   (const double &length_km, const double &lc_km, const double &Ct=2.0);
double          SnyderPeak      (const double &area_km2, const double &tp_hr, const double &Cp=0.6);
void            SnyderWidths    (const double &qp_m3s, const double &area_km2, double &W50_hr, double &W75_hr);
double          ClarkTimeArea   (const double &t_over_tc);

unit_hydrograph TriangularUHX   (const double &area_ha, const double &tc_hr, const double &dt_hr, const double &X=1.0);
unit_hydrograph SCSTriangularUH (const double &area_km2, const double &tc_hr, const double &dt_hr);
unit_hydrograph SCSCurvilinearUH(const double &area_km2, const double &tc_hr, const double &dt_hr, const double &prf=484.0);
unit_hydrograph GammaUH         (const double &area_km2, const double &tc_hr, const double &dt_hr, const double &m=3.7);
unit_hydrograph SnyderUH        (const double &area_km2, const double &length_km, const double &lc_km, const double &dt_hr,
                                 const double &Ct=2.0, const double &Cp=0.6);
unit_hydrograph ClarkUH         (const double &area_km2, const double &tc_hr, const double &R_hr, const double &dt_hr);

unit_hydrograph GenerateUnitHydrograph(const uh_method method, const unit_hydrograph_params &P);
uh_method       StringToUHMethod(const string s);
string          UHMethodToString(const uh_method method);

vector<double>  ConvolveUH      (const vector<double> &excess_mm, const vector<double> &uh_m3s);
hydrograph_result GenerateHydrograph(const vector<double> &excess_mm, const unit_hydrograph &UH, const double &dt_hr);

#endif

/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  IDFCurves.h
  ------------------------------------------------------------------
  Intensity-duration-frequency relations: power-law families and
  the DINAGUA regional formula for Uruguay
  ----------------------------------------------------------------*/
#ifndef IDFCURVES_H
#define IDFCURVES_H

#include "PluvialInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief IDF curve families
//
enum idf_type
{
  IDF_SHERMAN,        ///< i = k T^m / (t+c)^n        params {k,m,c,n}
  IDF_BERNARD,        ///< i = a T^m / t^n            params {a,m,n}
  IDF_KOUTSOYIANNIS,  ///< i = a(T) / (t+theta)^eta   params {mu,sigma,theta,eta}
  IDF_DINAGUA         ///< DINAGUA regional formula   params {P3_10,area_km2}
};

///////////////////////////////////////////////////////////////////
/// \brief results of DINAGUA precipitation calculation
//
struct dinagua_result
{
  double depth_mm;        ///< precipitation depth [mm]
  double intensity_mmhr;  ///< mean intensity over duration [mm/hr]
  double Cd;              ///< duration factor [-]
  double Ct;              ///< return period factor [-]
  double CA;              ///< areal reduction factor [-]
};

///////////////////////////////////////////////////////////////////
/// \brief IDF table over a grid of durations and return periods
/// \details matrices are indexed [return period][duration]
//
struct idf_table
{
  vector<double>           durations_min;   ///< durations [min]
  vector<double>           return_periods;  ///< return periods [yr]
  vector<vector<double> >  intensity_mmhr;  ///< mean intensity [mm/hr]
  vector<vector<double> >  depth_mm;        ///< depth [mm]
};

/*****************************************************************
   Class CIDFCurve
------------------------------------------------------------------
   Data abstraction for an IDF relation of one of several families
******************************************************************/
class CIDFCurve
{
private:/*-------------------------------------------------------*/
  idf_type _type;       ///< IDF family
  double   _aParams[4]; ///< family coefficients (see idf_type)
  int      _nParams;    ///< number of coefficients used

public:/*-------------------------------------------------------*/
  CIDFCurve(const idf_type type, const double *aParams, const int nParams);
  ~CIDFCurve();

  idf_type GetType     () const;
  double   GetParameter(const int i) const;

  double   GetIntensity(const double &duration_min, const double &Tr) const;
  double   GetDepth    (const double &duration_min, const double &Tr) const;

  static idf_type StringToIDFType(const string s);
};

idf_table       GenerateIDFTable     (const vector<double> &durations_min, const vector<double> &return_periods, const CIDFCurve &curve);
CIDFCurve       FitShermanCoefficients(const vector<double> &durations_min, const vector<double> &intensities_mmhr, const double &Tr);

//DINAGUA regional formula (IDFCurves.cpp)
double          DinaguaCd            (const double &duration_hr);
double          DinaguaCt            (const double &Tr);
double          DinaguaCA            (const double &area_km2, const double &duration_hr);
dinagua_result  DinaguaPrecipitation (const double &P3_10, const double &Tr, const double &duration_hr, const double &area_km2);
double          DinaguaDepth         (const double &P3_10, const double &Tr, const double &duration_hr, const double &area_km2=PLV_BLANK_DATA);
double          DinaguaIntensity     (const double &P3_10, const double &Tr, const double &duration_hr, const double &area_km2=PLV_BLANK_DATA);
double          GetDepartmentP3_10   (const string department);

#endif

/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  CoefficientTables.h
  ------------------------------------------------------------------
  Reference runoff coefficient (C) and curve number (CN) tables,
  return-period adjustment and area weighting
  ----------------------------------------------------------------*/
#ifndef COEFFICIENTTABLES_H
#define COEFFICIENTTABLES_H

#include "PluvialInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief runoff coefficient reference tables
//
enum coeff_table
{
  TABLE_CHOW,     ///< Ven Te Chow, Applied Hydrology; C tabulated by return period
  TABLE_FHWA,     ///< FHWA HEC-22; base C with frequency factor
  TABLE_URUGUAY   ///< regional table for Uruguay; min/max/typical C
};

///////////////////////////////////////////////////////////////////
/// \brief antecedent moisture condition
//
enum amc_type
{
  AMC_I,    ///< dry
  AMC_II,   ///< average (tabulated CN)
  AMC_III   ///< wet
};

///////////////////////////////////////////////////////////////////
/// \brief source of a coverage item's coefficient
//
enum coverage_source
{
  COVERAGE_FROM_TABLE, ///< coefficient looked up from table row table_index
  COVERAGE_OPAQUE      ///< coefficient supplied directly in value
};

///////////////////////////////////////////////////////////////////
/// \brief portion of a basin with uniform cover
//
struct coverage_item
{
  double          area_ha;      ///< area of cover [ha]
  coverage_source source;       ///< tag
  int             table_index;  ///< table row (COVERAGE_FROM_TABLE only)
  double          value;        ///< coefficient (COVERAGE_OPAQUE), or value at reference Tr
};

coverage_item CoverageFromTable(const double &area_ha, const int table_index, const double &value=PLV_BLANK_DATA);
coverage_item CoverageOpaque   (const double &area_ha, const double &value);

//table access
int         GetNumTableEntries  (const coeff_table table);
string      GetTableEntryName   (const coeff_table table, const int index);
coeff_table StringToCoeffTable  (const string s);
string      CoeffTableToString  (const coeff_table table);

double      GetChowC            (const int index, const double &Tr);
double      FHWAFrequencyFactor (const double &Tr);
double      GetFHWAC            (const int index, const double &Tr);
double      GetUruguayC         (const int index);
double      GetCForTrFromTable  (const coeff_table table, const int index, const double &Tr);

int         GetNumCNEntries     ();
int         GetNumUrbanCNEntries();
string      GetCNEntryName      (const int index);
double      GetCN               (const int index, const string soil_group);

//adjustment and weighting
double      AdjustCForTr        (const double &C_base, const double &Tr, const double &base_Tr=2.0);
double      WeightedCoefficient (const vector<double> &areas, const vector<double> &values);
double      RecalculateWeightedCForTr(const vector<coverage_item> &items, const double &Tr, const coeff_table table);
double      WeightedCNFromItems (const vector<coverage_item> &items, const string soil_group);
void        CheckCoverageArea   (const vector<coverage_item> &items, const double &basin_area_ha);

double      AdjustCNForAMC      (const double &CN, const amc_type amc);
amc_type    StringToAMC         (const string s);
string      AMCToString         (const amc_type amc);

#endif

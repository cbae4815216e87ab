/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  DistributionRegistry.h
  ------------------------------------------------------------------
  Reference dimensionless rainfall distributions (SCS 24-hr types,
  Huff quartile curves) read from JSON data files
  ----------------------------------------------------------------*/
#ifndef DISTRIBUTIONREGISTRY_H
#define DISTRIBUTIONREGISTRY_H

#include "PluvialInclude.h"
#include "LookupTable.h"

///////////////////////////////////////////////////////////////////
/// \brief SCS (NRCS) 24-hour synthetic storm types
//
enum scs_storm_type
{
  SCS_TYPE_I,
  SCS_TYPE_IA,
  SCS_TYPE_II,
  SCS_TYPE_III
};

string         SCSStormTypeToString(const scs_storm_type type);
scs_storm_type StringToSCSStormType(const string s);

/*****************************************************************
   Class CDistributionRegistry
------------------------------------------------------------------
   Immutable store of dimensionless cumulative rainfall curves.
   Built once from a data directory containing
   scs_distributions.json and huff_curves.json
******************************************************************/
class CDistributionRegistry
{
private:/*-------------------------------------------------------*/
  string                      _data_dir;  ///< directory data was read from
  map<string,CLookupTable*>   _curves;    ///< curves by key (e.g., "scs_type_ii", "huff_q2_p50")

  void LoadSCSDistributions(const string filename);
  void LoadHuffCurves      (const string filename);
  void AddCurve            (const string key, const vector<double> &x, const vector<double> &y);
  void DeleteAllCurves     ();
  const CLookupTable *GetCurve(const string key) const;

  CDistributionRegistry(const CDistributionRegistry &);            //not implemented
  CDistributionRegistry &operator=(const CDistributionRegistry &); //not implemented

public:/*-------------------------------------------------------*/
  CDistributionRegistry(const string data_dir);
  ~CDistributionRegistry();

  string              GetDataDirectory  () const;
  int                 GetNumCurves      () const;

  const CLookupTable *GetSCSDistribution(const scs_storm_type type) const;
  const CLookupTable *GetHuffCurve      (const int quartile, const int probability) const;

  static string       GetDefaultDataDirectory();
};

#endif

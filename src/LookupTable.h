/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  LookupTable.h
  ----------------------------------------------------------------*/
#ifndef LOOKUPTABLE_H
#define LOOKUPTABLE_H

#include "PluvialInclude.h"

///////////////////////////////////////////////////////////////////
/// \brief Data abstraction for general piecewise-linear lookup table y(x)
/// \details x must be strictly increasing; values are held constant beyond the table ends
//
class CLookupTable
{
 private:
  string  _name;
  double *_aX;
  double *_aY;
  int     _nItems;

  CLookupTable(const CLookupTable &);            //not implemented
  CLookupTable &operator=(const CLookupTable &); //not implemented

 public:
  CLookupTable(string name, const double *x, const double *y, int N);
  CLookupTable(string name, const vector<double> &x, const vector<double> &y);
  ~CLookupTable();

  string GetName    () const;
  int    GetNumItems() const;
  double GetMinX    () const;
  double GetMaxX    () const;
  double GetX       (const int i) const;
  double GetY       (const int i) const;

  double GetValue   (const double &x) const;
};
#endif

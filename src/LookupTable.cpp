/*----------------------------------------------------------------
Pluvial Library Source Code
Copyright (c) 2024-2026 the Pluvial Development Team
----------------------------------------------------------------*/
#include "LookupTable.h"

//////////////////////////////////////////////////////////////////
// Constructor/Destructor
//
CLookupTable::CLookupTable(string name, const double* x, const double* y, int N)
{
  ExitGracefullyIf(N<1,"CLookupTable: table "+name+" must have at least one item",BAD_DATA);
  _name=name;
  _aX=new double [N];
  _aY=new double [N];
  _nItems=N;
  for (int i = 0; i < _nItems; i++) {
    _aX[i]=x[i];
    _aY[i]=y[i];
  }
  for (int i = 1; i < _nItems; i++) {
    if (_aX[i]<=_aX[i-1]){
      delete [] _aX; delete [] _aY;
      ExitGracefully("CLookupTable: abscissae of table "+name+" must be strictly increasing",BAD_DATA);
    }
  }
}
//////////////////////////////////////////////////////////////////
CLookupTable::CLookupTable(string name, const vector<double> &x, const vector<double> &y)
{
  ExitGracefullyIf(x.size()!=y.size(),"CLookupTable: table "+name+" has columns of unequal length",BAD_DATA);
  ExitGracefullyIf(x.empty(),"CLookupTable: table "+name+" must have at least one item",BAD_DATA);
  _name=name;
  _nItems=(int)(x.size());
  _aX=new double [_nItems];
  _aY=new double [_nItems];
  for (int i = 0; i < _nItems; i++) {
    _aX[i]=x[i];
    _aY[i]=y[i];
  }
  for (int i = 1; i < _nItems; i++) {
    if (_aX[i]<=_aX[i-1]){
      delete [] _aX; delete [] _aY;
      ExitGracefully("CLookupTable: abscissae of table "+name+" must be strictly increasing",BAD_DATA);
    }
  }
}
CLookupTable::~CLookupTable() {
  delete [] _aX;
  delete [] _aY;
}
//////////////////////////////////////////////////////////////////
// Accessors
//
string CLookupTable::GetName()     const {return _name;}
int    CLookupTable::GetNumItems() const {return _nItems;}
double CLookupTable::GetMinX()     const {return _aX[0];}
double CLookupTable::GetMaxX()     const {return _aX[_nItems-1];}
double CLookupTable::GetX(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=_nItems),"CLookupTable::GetX: bad index",RUNTIME_ERR);
  return _aX[i];
}
double CLookupTable::GetY(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=_nItems),"CLookupTable::GetY: bad index",RUNTIME_ERR);
  return _aY[i];
}
//////////////////////////////////////////////////////////////////
/// \brief returns interpolated value; constant beyond either end of table
//
double CLookupTable::GetValue(const double& x) const
{
  if (x==PLV_BLANK_DATA){return PLV_BLANK_DATA;}
  return InterpolateClamped(x,_aX,_aY,_nItems);
}

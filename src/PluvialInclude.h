/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  PluvialInclude.h
  ------------------------------------------------------------------
  Global definitions, constants, enumerated types and
  common function declarations
  ----------------------------------------------------------------*/
#ifndef PLUVIALINCLUDE_H
#define PLUVIALINCLUDE_H

#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cmath>
#include <vector>
#include <map>
#include <algorithm>
#include <functional>
#include <stdexcept>

using namespace std;

const string __PLUVIAL_VERSION__ ="1.3";

//*****************************************************************
// Global Variables (necessary, but minimized)
//*****************************************************************
extern string g_output_directory;  ///< Had to be here to avoid passing Options structure around willy-nilly
extern bool   g_suppress_warnings; ///< Suppresses warnings to errors file

//*****************************************************************
// Global Constants
//*****************************************************************
const double  PLV_BLANK_DATA      =-1.2345;     ///< double corresponding to blank/unspecified value
const int     DOESNT_EXIST        =-1;          ///< return value for nonexistent index
const double  REAL_SMALL          =1e-12;       ///< small double value
const double  ALMOST_INF          =1e99;        ///< largest double value

const int     MAXINPUTITEMS       =500;         ///< maximum delimited input items per line
const int     MAXCHARINLINE       =6000;        ///< maximum characters in a line

//Conversions
const double  MIN_PER_HR          =60.0;        ///< minutes per hour
const double  SEC_PER_HR          =3600.0;      ///< seconds per hour
const double  M_PER_KM            =1000.0;      ///< meters per kilometer
const double  HA_PER_KM2          =100.0;       ///< hectares per square kilometer
const double  FEET_PER_METER      =3.28084;     ///< [ft/m]
const double  MILES_PER_KM        =0.621371;    ///< [mi/km]
const double  MM_PER_INCH         =25.4;        ///< [mm/in]
const double  SQMI_PER_KM2        =0.386102;    ///< [mi2/km2]
const double  M3S_PER_CFS         =0.0283168;   ///< [m3/s per ft3/s]
const double  M3_PER_MM_KM2       =1000.0;      ///< volume of 1 mm over 1 km2 [m3]

//Rational method / unit hydrograph constants
const double  RATIONAL_UNIT_CONV  =0.00278;     ///< [m3/s per (mm/hr*ha)]
const double  UH_UNIT_CONV        =0.278;       ///< [m3/s per (mm/hr*km2)]
const double  SCS_PEAK_COEFF      =0.208;       ///< SCS UH peak rate coefficient for 1 mm of runoff [m3/s per (mm*km2/hr)]
const double  SCS_STANDARD_PRF    =484.0;       ///< standard SCS peak rate factor
const double  SCS_X_FACTOR        =1.67;        ///< implied recession factor of SCS triangular UH

//Default parameters
const double  DEFAULT_INLET_TIME  =5.0;         ///< Desbordes inlet time [min]
const double  DEFAULT_NRCS_P2     =50.0;        ///< NRCS 2-yr, 24-hr rainfall [mm]
const double  DEFAULT_LAMBDA      =0.2;         ///< SCS-CN initial abstraction ratio
const double  DEFAULT_CHICAGO_R   =0.375;       ///< Chicago storm advancement coefficient
const int     KINEMATIC_MAX_ITER  =20;          ///< kinematic wave maximum iterations
const double  KINEMATIC_TOL       =0.01;        ///< kinematic wave convergence tolerance [hr]

/******************************************************************
  Exit Strategies
******************************************************************/
///////////////////////////////////////////////////////////////////
/// \brief Types of exit strategies
//
enum exitcode
{
  SIMULATION_DONE,   ///< Analysis complete
  RUNTIME_ERR,       ///< Runtime error
  BAD_DATA,          ///< Bad input data
  BAD_DATA_WARN,     ///< Bad input data, but only write to file, warn, don't exit
  OUT_OF_MEMORY,     ///< Out of memory
  FILE_OPEN_ERR,     ///< File opening error
  PLUVIAL_OPEN_ERR,  ///< Error opening Pluvial_errors.txt
  STUB               ///< Function stub
};

///////////////////////////////////////////////////////////////////
/// \brief Exception raised by ExitGracefully() within the engine library
/// \details carries exit code so that calling program may finalize accordingly
//
class CPluvialException : public runtime_error
{
private:
  exitcode _code;
public:
  CPluvialException(const string &statement, exitcode code)
    : runtime_error(statement),_code(code) {}
  exitcode GetCode() const {return _code;}
};

void ExitGracefully  (const char *statement, exitcode code);
void ExitGracefully  (const string &statement, exitcode code);

/////////////////////////////////////////////////////////////////
/// \brief In-line function that calls ExitGracefully function in the case of condition
/// \param condition [in] Boolean indicating if program should exit gracefully
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
inline void ExitGracefullyIf(bool condition, const char *statement, exitcode code)
{
  if (condition){ExitGracefully(statement,code);}
}
inline void ExitGracefullyIf(bool condition, const string &statement, exitcode code)
{
  if (condition){ExitGracefully(statement.c_str(),code);}
}

/******************************************************************
   Options
******************************************************************/
///////////////////////////////////////////////////////////////////
/// \brief Global standalone program options
//
struct optStruct
{
  string version;            ///< Pluvial version
  string run_name;           ///< prefix for all output files
  string rvs_filename;       ///< fully qualified filename of analysis input file (*.rvs)
  string data_dir;           ///< directory of reference distribution data
  string output_dir;         ///< output directory (with trailing '/', or empty)
  string main_output_dir;    ///< primary output directory (output_dir gets modified)

  bool   noisy;              ///< true if program should give lots of screen output
  bool   silent;             ///< true if program should give minimal screen output
  bool   pause;              ///< true if program should pause at end of run
};

/******************************************************************
  Common Functions (CommonFunctions.cpp)
******************************************************************/
//Warnings and logging
void        WriteWarning         (const string warn, bool noisy);
void        WriteAdvisory        (const string warn, bool noisy);

//String functions
string      StringToUppercase    (const string &s);
string      StringToLowercase    (const string &s);
bool        IsComment            (const char *s, const int Len);
void        SubstringReplace     (string &str,const string &from,const string &to);
bool        StringIsDouble       (const string &s);
string      FormatDoubleString   (const double &d, const int precision);
string      CorrectForRelativePath(const string filename,const string relfile);

inline int      s_to_i (const char *s1)   {return (int)atof(s1);   }
inline double   s_to_d (const char *s1)   {return atof(s1);        }

//Numerical and array functions
int         SmartIntervalSearch  (const double &x,const double *ax,const int N,const int iguess);
double      InterpolateCurve     (const double x,const double *xx,const double *y,int N,bool extrapbottom);
double      InterpolateClamped   (const double x,const double *xx,const double *y,int N);
double      TrapezoidIntegral    (const vector<double> &y, const vector<double> &x);
vector<double> Linspace          (const double &start, const double &end, const int N);
vector<double> CumulativeSum     (const vector<double> &a);
vector<double> Differences       (const vector<double> &cumul);
double      VectorSum            (const vector<double> &a);
double      VectorMax            (const vector<double> &a);
int         VectorArgMax         (const vector<double> &a);

#endif

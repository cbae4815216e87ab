/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  CommonFunctions.cpp
  ----------------------------------------------------------------*/
#include "PluvialInclude.h"

// Global variables - declared as extern in PluvialInclude.h--------
string g_output_directory ="";
bool   g_suppress_warnings=false;

/////////////////////////////////////////////////////////////////
/// \brief Exits gracefully from engine routine, explaining reason for exit
/// \remark Called from within code; calling program decides how to finalize
/// \note BAD_DATA_WARN is only written to the errors file
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
void ExitGracefully(const char *statement, exitcode code)
{
  if (code==BAD_DATA_WARN){
    WriteWarning(statement,false);
    return;
  }
  throw CPluvialException(statement,code);
}
void ExitGracefully(const string &statement, exitcode code)
{
  ExitGracefully(statement.c_str(),code);
}

/////////////////////////////////////////////////////////////////
/// \brief writes warning to screen and to Pluvial_errors.txt file
/// \param warn [in] warning message printed
//
void WriteWarning(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Pluvial_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"WARNING!: "<<warn<<endl;}
    WARNINGS<<"WARNING  : "<<warn<<endl;
    WARNINGS.close();
  }
}
/////////////////////////////////////////////////////////////////
/// \brief writes advisory to screen and to Pluvial_errors.txt file
/// \param warn [in] warning message printed
//
void WriteAdvisory(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Pluvial_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"ADVISORY: "<<warn<<endl;}
    WARNINGS<<"ADVISORY : "<<warn<<endl;
    WARNINGS.close();
  }
}

//////////////////////////////////////////////////////////////////
/// \brief converts string to uppercase
/// \param &s [in] string to be converted
/// \return &s converted to uppercase
//
string StringToUppercase(const string &s)
{
  string ret(s.size(), char());
  for(int i = 0; i < (int)(s.size()); ++i)
  {
    if ((s[i] <= 'z' && s[i] >= 'a')){ret[i] =  s[i]-('a'-'A');}
    else                             {ret[i]  = s[i];}
  }
  return ret;
}
//////////////////////////////////////////////////////////////////
/// \brief converts string to lowercase
//
string StringToLowercase(const string &s)
{
  string ret(s.size(), char());
  for(int i = 0; i < (int)(s.size()); ++i)
  {
    if ((s[i] <= 'Z' && s[i] >= 'A')){ret[i] =  s[i]+('a'-'A');}
    else                             {ret[i]  = s[i];}
  }
  return ret;
}

//////////////////////////////////////////////////////////////////
/// \brief returns true if line is empty or begins with '#' or '*'
/// \param *s [in] first string in line
/// \param Len [in] length of line
/// \return true if line is empty or a comment
//
bool IsComment(const char *s, const int Len)
{
  if ((Len==0) || (s[0]=='#') || (s[0]=='*')){return true;}
  return false;
}
//////////////////////////////////////////////////////////////////
/// \brief replaces all instances of substring 'from' with string 'to' in string str
/// \param &str [in/out] string subjected to modification
/// \param &from [in] substring to be replaced
/// \param &to [in]  substring to replace it with
//
void SubstringReplace(string &str,const string &from,const string &to)
{
  if(from.empty()) { return; }
  size_t start_pos = 0;
  while((start_pos = str.find(from,start_pos)) != std::string::npos) {
    str.replace(start_pos,from.length(),to);
    start_pos += to.length(); // In case 'to' contains 'from', like replacing 'x' with 'yx'
  }
}
//////////////////////////////////////////////////////////////////
/// \brief returns true if entire string can be read as a double
//
bool StringIsDouble(const string &s)
{
  if (s.empty()){return false;}
  char *end=NULL;
  strtod(s.c_str(),&end);
  return (*end=='\0');
}
//////////////////////////////////////////////////////////////////
/// \brief writes double to string with fixed precision
//
string FormatDoubleString(const double &d, const int precision)
{
  ostringstream ss;
  ss<<fixed<<setprecision(precision)<<d;
  return ss.str();
}
//////////////////////////////////////////////////////////////////
/// \brief returns filename corrected for path of reference file relfile
/// \details if filename is relative, it is taken relative to the directory of relfile
//
string CorrectForRelativePath(const string filename,const string relfile)
{
  size_t slash=relfile.find_last_of("/\\");
  if (slash==string::npos){return filename;}
  string filedir=relfile.substr(0,slash);

  if (filename.empty()){return filename;}
  string firstchar  = filename.substr(0, 1);                         // if '/' --> absolute path on UNIX systems
  string secondchar = (filename.size()>1) ? filename.substr(1, 1):""; // if ':' --> absolute path on WINDOWS system
  if ( (firstchar.compare("/") != 0) && (secondchar.compare(":") != 0) ){
    return filedir + "/" + filename;
  }
  return filename;
}

///////////////////////////////////////////////////////////////////////////
/// \brief identifies index location of value in uneven continuous list of sorted value ranges
///
/// \param &x [in] value for which the interval index is to be found
/// \param *ax [in] array of consecutive values from ax[0] to ax[N-1] indicating interval boundaries
/// \param N [in] size of array ax
/// \param iguess [in] best guess as to which interval x is in
/// \return interval index value (index refers to lower bound of interval, i.e., i indicates x is between ax[i] and ax[i+1]
/// \note returns -1 if outside of range
//
int SmartIntervalSearch(const double &x,const double *ax,const int N,const int iguess)
{
  if (N<2){return DOESNT_EXIST;}
  int i=iguess;
  if((iguess>N-2) || (iguess<0)) { i=0; }
  if((x>=ax[i]) && (x<ax[i+1])) { return i; }

  int plus,plus2;
  for(int d=1;d<N/2+1;d++)
  {
    plus =i+d;    if(plus >N-1) { plus -=N; } //wrap
    plus2=i+d+1;  if(plus2>N-1) { plus2-=N; } //wrap
    if((plus2==plus+1) && (x>=ax[plus]) && (x<ax[plus2])) { return plus; }
    plus =i-d;    if(plus <0) { plus +=N; } //wrap
    plus2=i-d+1;  if(plus2<0) { plus2+=N; }   //wrap
    if((plus2==plus+1) && (x>=ax[plus]) && (x<ax[plus2])) { return plus; }
  }
  return DOESNT_EXIST;
}

//////////////////////////////////////////////////////////////////
/// \brief interpolates value from rating curve
/// \param x [in] interpolation location
/// \param xx [in] array (size:N) of vertices ordinates of interpolant
/// \param y [in] array (size:N)  of values corresponding to array points xx
/// \param N size of arrays x and y
/// \returns y value corresponding to interpolation point
/// \note does not assume regular spacing between min and max x value
/// \note if below minimum xx, either extrapolates (if extrapbottom=true), or uses minimum value
/// \note if above maximum xx, always extrapolates
//
double InterpolateCurve(const double x,const double *xx,const double *y,int N,bool extrapbottom)
{
  if(x<=xx[0])
  {
    if(extrapbottom) { return y[0]+(y[1]-y[0])/(xx[1]-xx[0])*(x-xx[0]); }
    return y[0];
  }
  else if(x>=xx[N-1])
  {
    return y[N-1]+(y[N-1]-y[N-2])/(xx[N-1]-xx[N-2])*(x-xx[N-1]);
  }
  else
  {
    int i=SmartIntervalSearch(x,xx,N,0);
    ExitGracefullyIf(i==DOESNT_EXIST,"InterpolateCurve::mis-ordered list or infinite x",RUNTIME_ERR);
    if (fabs(xx[i+1]-xx[i]) < REAL_SMALL) { return (y[i]+y[i+1])/2; }  // x locations too close to each other
    return y[i]+(y[i+1]-y[i])/(xx[i+1]-xx[i])*(x-xx[i]);
  }
}
//////////////////////////////////////////////////////////////////
/// \brief piecewise-linear interpolation, held constant beyond both ends of the curve
/// \param x [in] interpolation location
/// \param xx [in] array (size:N) of increasing vertices
/// \param y [in] array (size:N) of values at vertices
//
double InterpolateClamped(const double x,const double *xx,const double *y,int N)
{
  if (N==1)       {return y[0];}
  if (x<=xx[0])   {return y[0];}
  if (x>=xx[N-1]) {return y[N-1];}
  return InterpolateCurve(x,xx,y,N,false);
}

//////////////////////////////////////////////////////////////////
/// \brief trapezoidal integral of y(x)
//
double TrapezoidIntegral(const vector<double> &y, const vector<double> &x)
{
  ExitGracefullyIf(y.size()!=x.size(),"TrapezoidIntegral: array size mismatch",RUNTIME_ERR);
  double sum=0.0;
  for (int i=1;i<(int)(y.size());i++){
    sum+=0.5*(y[i]+y[i-1])*(x[i]-x[i-1]);
  }
  return sum;
}
//////////////////////////////////////////////////////////////////
/// \brief returns N evenly spaced values from start to end, inclusive
//
vector<double> Linspace(const double &start, const double &end, const int N)
{
  vector<double> v;
  if (N<=0){return v;}
  v.resize(N);
  if (N==1){v[0]=start;return v;}
  double step=(end-start)/(double)(N-1);
  for (int i=0;i<N;i++){v[i]=start+step*i;}
  v[N-1]=end;
  return v;
}
//////////////////////////////////////////////////////////////////
/// \brief running sum of array
//
vector<double> CumulativeSum(const vector<double> &a)
{
  vector<double> c(a.size(),0.0);
  double sum=0.0;
  for (int i=0;i<(int)(a.size());i++){sum+=a[i];c[i]=sum;}
  return c;
}
//////////////////////////////////////////////////////////////////
/// \brief first differences of cumulative array; first entry is cumul[0]
//
vector<double> Differences(const vector<double> &cumul)
{
  vector<double> d(cumul.size(),0.0);
  for (int i=0;i<(int)(cumul.size());i++){
    if (i==0){d[i]=cumul[0];}
    else     {d[i]=cumul[i]-cumul[i-1];}
  }
  return d;
}
//////////////////////////////////////////////////////////////////
double VectorSum(const vector<double> &a)
{
  double sum=0.0;
  for (int i=0;i<(int)(a.size());i++){sum+=a[i];}
  return sum;
}
//////////////////////////////////////////////////////////////////
double VectorMax(const vector<double> &a)
{
  if (a.empty()){return 0.0;}
  return a[VectorArgMax(a)];
}
//////////////////////////////////////////////////////////////////
/// \brief index of first maximum entry, DOESNT_EXIST if empty
//
int VectorArgMax(const vector<double> &a)
{
  if (a.empty()){return DOESNT_EXIST;}
  int imax=0;
  for (int i=1;i<(int)(a.size());i++){
    if (a[i]>a[imax]){imax=i;}
  }
  return imax;
}

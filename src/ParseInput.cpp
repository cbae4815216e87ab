/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------*/
#include "PluvialInclude.h"
#include "PluvialMain.h"
#include "ParseLib.h"

void ImproperFormatWarning(string command, CParser *p, bool noisy);
bool ParseNRCSSegments    (CParser *p, vector<nrcs_segment> &segments, const optStruct &Options);
bool ParseCoverageLine    (char **s, const int Len, vector<coverage_item> &items, const string command);

///////////////////////////////////////////////////////////////////
/// \brief Parses the analysis input file (.rvs), filling basin descriptors and analysis options
///
/// \details the .rvs file contains :Command value lines, e.g.,\n
///   :Area            45.0\n
///   :Slope           2.5\n
///   :P3_10           83\n
///   :TcMethods       kirpich desbordes\n
///   :StormCodes      gz blocks24\n
///   :ReturnPeriods   2 10 25\n
///
/// \param &basin [out] watershed descriptors
/// \param &AO [out] analysis options
/// \param &Options [in] Global program options information
/// \return true if file was found and parsed
//
bool ParseAnalysisFile(basin_params &basin, analysis_options &AO, const optStruct &Options)
{
  int         code;
  bool        ended(false);
  int         Len,line(0);
  char       *s[MAXINPUTITEMS];
  ifstream    INPUT;
  ifstream    INPUT2;            //For Secondary input
  CParser    *pMainParser=NULL;  //for storage of main parser while reading secondary files

  bool        tc_set(false),storm_set(false),tr_set(false),x_set(false);

  if (Options.noisy){
    cout <<"======================================================"<<endl;
    cout <<"Parsing Analysis Input File " << Options.rvs_filename <<"..."<<endl;
    cout <<"======================================================"<<endl;
  }

  INPUT.open(Options.rvs_filename.c_str());
  if (INPUT.fail()){
    cout << "ERROR opening file: "<< Options.rvs_filename<<endl; return false;
  }

  CParser *p=new CParser(INPUT,Options.rvs_filename,line);

  //===============================================================================================
  // Sift through file, processing each command
  //===============================================================================================
  bool end_of_file=p->Tokenize(s,Len);
  while (!end_of_file)
  {
    if (ended){break;}
    if (Options.noisy){ cout << "reading line " << p->GetLineNumber() << ": ";}

    /*assign code for switch statement
      ------------------------------------------------------------------
      <0           : ignored/special
      1   thru 19  : Basin descriptors
      20  thru 29  : Time of concentration
      30  thru 39  : Storms and analysis product
      40  thru 59  : Bimodal and custom storms
      60  thru 79  : Runoff options and coverage weighting
      ------------------------------------------------------------------
    */

    code=0;
    //---------------------SPECIAL -----------------------------
    if       (Len==0)                                     {code=-1; }
    else if  (IsComment(s[0],Len))                        {code=-2; }//comment
    else if  (!strcmp(s[0],":End"                       )){code=-3; }//premature end of file
    else if  (!strcmp(s[0],":RedirectToFile"            )){code=-4; }//redirect to secondary file
    //--------------------BASIN ---------------------------------
    else if  (!strcmp(s[0],":BasinName"                 )){code=1;  }
    else if  (!strcmp(s[0],":Area"                      )){code=2;  }
    else if  (!strcmp(s[0],":Slope"                     )){code=3;  }
    else if  (!strcmp(s[0],":ChannelLength"             )){code=4;  }
    else if  (!strcmp(s[0],":ElevationDrop"             )){code=5;  }
    else if  (!strcmp(s[0],":P3_10"                     )){code=6;  }
    else if  (!strcmp(s[0],":Department"                )){code=7;  }
    else if  (!strcmp(s[0],":RunoffCoefficient"         )){code=8;  }
    else if  (!strcmp(s[0],":CurveNumber"               )){code=9;  }
    else if  (!strcmp(s[0],":SoilGroup"                 )){code=10; }
    //--------------------TIME OF CONCENTRATION------------------
    else if  (!strcmp(s[0],":TcMethods"                 )){code=20; }
    else if  (!strcmp(s[0],":InletTime"                 )){code=21; }
    else if  (!strcmp(s[0],":KirpichSurface"            )){code=22; }
    else if  (!strcmp(s[0],":NRCSSegments"              )){code=23; }
    else if  (!strcmp(s[0],":NRCSDefaultP2"             )){code=24; }
    else if  (!strcmp(s[0],":KinematicWave"             )){code=25; }
    //--------------------STORMS --------------------------------
    else if  (!strcmp(s[0],":StormCodes"                )){code=30; }
    else if  (!strcmp(s[0],":ReturnPeriods"             )){code=31; }
    else if  (!strcmp(s[0],":XFactors"                  )){code=32; }
    else if  (!strcmp(s[0],":TimeStep"                  )){code=33; }
    else if  (!strcmp(s[0],":RunoffMethods"             )){code=34; }
    else if  (!strcmp(s[0],":BimodalPeaks"              )){code=40; }
    else if  (!strcmp(s[0],":BimodalVolumeSplit"        )){code=41; }
    else if  (!strcmp(s[0],":BimodalPeakWidth"          )){code=42; }
    else if  (!strcmp(s[0],":BimodalDuration"           )){code=43; }
    else if  (!strcmp(s[0],":CustomDepth"               )){code=50; }
    else if  (!strcmp(s[0],":CustomDistribution"        )){code=51; }
    else if  (!strcmp(s[0],":CustomDuration"            )){code=52; }
    else if  (!strcmp(s[0],":CustomHyetograph"          )){code=53; }
    //--------------------RUNOFF --------------------------------
    else if  (!strcmp(s[0],":AMC"                       )){code=60; }
    else if  (!strcmp(s[0],":Lambda"                    )){code=61; }
    else if  (!strcmp(s[0],":CoverageTable"             )){code=70; }
    else if  (!strcmp(s[0],":Coverage"                  )){code=71; }
    else if  (!strcmp(s[0],":CNCoverage"                )){code=72; }

    else if  (!strcmp(s[0],":UnitHydrograph"            )){code=80; }
    else if  (!strcmp(s[0],":PeakRateFactor"            )){code=81; }
    else if  (!strcmp(s[0],":GammaShape"                )){code=82; }
    else if  (!strcmp(s[0],":SnyderCoefficients"        )){code=83; }
    else if  (!strcmp(s[0],":CentroidDistance"          )){code=84; }
    else if  (!strcmp(s[0],":ClarkStorage"              )){code=85; }

    switch(code)
    {
    case(-1):  //----------------------------------------------
    {/*Blank Line*/
      if (Options.noisy) {cout <<""<<endl;}break;
    }
    case(-2):  //----------------------------------------------
    {/*Comment # */
      if (Options.noisy) {cout <<"*"<<endl;} break;
    }
    case(-3):  //----------------------------------------------
    {/*:End*/
      if (Options.noisy) {cout <<"EOF"<<endl;} ended=true; break;
    }
    case(-4):  //----------------------------------------------
    {/*:RedirectToFile*/
      string filename="";
      for(int i=1;i<Len;i++) { filename+=s[i]; if(i<Len-1) { filename+=' '; } }
      if(Options.noisy) { cout <<"Redirect to file: "<<filename<<endl; }

      filename =CorrectForRelativePath(filename,Options.rvs_filename);

      INPUT2.open(filename.c_str());
      if(INPUT2.fail()) {
        string warn=":RedirectToFile: Cannot find file "+filename;
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      else {
        if (pMainParser != NULL) {
          ExitGracefully("ParseAnalysisFile::nested :RedirectToFile commands (in already redirected files) are not allowed.",BAD_DATA);
        }
        pMainParser=p;    //save pointer to primary parser
        p=new CParser(INPUT2,filename,line);//open new parser
      }
      break;
    }
    case(1):  //----------------------------------------------
    {/*:BasinName [name]*/
      if (Options.noisy) {cout <<"Basin name"<<endl;}
      if (Len<2){ImproperFormatWarning(":BasinName",p,Options.noisy); break;}
      basin.name="";
      for (int i=1;i<Len;i++){basin.name+=s[i]; if (i<Len-1){basin.name+=' ';}}
      break;
    }
    case(2):  //----------------------------------------------
    {/*:Area [ha]*/
      if (Options.noisy) {cout <<"Basin area"<<endl;}
      if (Len<2){ImproperFormatWarning(":Area",p,Options.noisy); break;}
      basin.area_ha=s_to_d(s[1]);
      ExitGracefullyIf(basin.area_ha<=0,"ParseAnalysisFile: :Area must be positive",BAD_DATA);
      break;
    }
    case(3):  //----------------------------------------------
    {/*:Slope [%]*/
      if (Options.noisy) {cout <<"Basin slope"<<endl;}
      if (Len<2){ImproperFormatWarning(":Slope",p,Options.noisy); break;}
      basin.slope_pct=s_to_d(s[1]);
      ExitGracefullyIf(basin.slope_pct<=0,"ParseAnalysisFile: :Slope must be positive",BAD_DATA);
      break;
    }
    case(4):  //----------------------------------------------
    {/*:ChannelLength [m]*/
      if (Options.noisy) {cout <<"Channel length"<<endl;}
      if (Len<2){ImproperFormatWarning(":ChannelLength",p,Options.noisy); break;}
      basin.length_m=s_to_d(s[1]);
      ExitGracefullyIf(basin.length_m<=0,"ParseAnalysisFile: :ChannelLength must be positive",BAD_DATA);
      break;
    }
    case(5):  //----------------------------------------------
    {/*:ElevationDrop [m]*/
      if (Options.noisy) {cout <<"Elevation drop"<<endl;}
      if (Len<2){ImproperFormatWarning(":ElevationDrop",p,Options.noisy); break;}
      basin.elevation_drop_m=s_to_d(s[1]);
      break;
    }
    case(6):  //----------------------------------------------
    {/*:P3_10 [mm]*/
      if (Options.noisy) {cout <<"P3,10"<<endl;}
      if (Len<2){ImproperFormatWarning(":P3_10",p,Options.noisy); break;}
      basin.P3_10=s_to_d(s[1]);
      ExitGracefullyIf(basin.P3_10<=0,"ParseAnalysisFile: :P3_10 must be positive",BAD_DATA);
      break;
    }
    case(7):  //----------------------------------------------
    {/*:Department [name]*/
      if (Options.noisy) {cout <<"Department (P3,10)"<<endl;}
      if (Len<2){ImproperFormatWarning(":Department",p,Options.noisy); break;}
      string dept="";
      for (int i=1;i<Len;i++){dept+=s[i]; if (i<Len-1){dept+=' ';}}
      basin.P3_10=GetDepartmentP3_10(dept);
      break;
    }
    case(8):  //----------------------------------------------
    {/*:RunoffCoefficient [C]*/
      if (Options.noisy) {cout <<"Runoff coefficient"<<endl;}
      if (Len<2){ImproperFormatWarning(":RunoffCoefficient",p,Options.noisy); break;}
      basin.C=s_to_d(s[1]);
      ExitGracefullyIf((basin.C<=0) || (basin.C>1),"ParseAnalysisFile: :RunoffCoefficient must be between 0 and 1",BAD_DATA);
      break;
    }
    case(9):  //----------------------------------------------
    {/*:CurveNumber [CN]*/
      if (Options.noisy) {cout <<"Curve number"<<endl;}
      if (Len<2){ImproperFormatWarning(":CurveNumber",p,Options.noisy); break;}
      basin.CN=s_to_d(s[1]);
      ExitGracefullyIf((basin.CN<30) || (basin.CN>100),"ParseAnalysisFile: :CurveNumber must be between 30 and 100",BAD_DATA);
      break;
    }
    case(10):  //----------------------------------------------
    {/*:SoilGroup [A|B|C|D]*/
      if (Options.noisy) {cout <<"Soil group"<<endl;}
      if (Len<2){ImproperFormatWarning(":SoilGroup",p,Options.noisy); break;}
      basin.soil_group=StringToUppercase(s[1]);
      break;
    }
    case(20):  //----------------------------------------------
    {/*:TcMethods [method1] [method2] ...*/
      if (Options.noisy) {cout <<"Tc methods"<<endl;}
      if (Len<2){ImproperFormatWarning(":TcMethods",p,Options.noisy); break;}
      if (!tc_set){AO.tc_methods.clear();tc_set=true;}
      for (int i=1;i<Len;i++){
        StringToTcMethod(s[i]); //validates
        AO.tc_methods.push_back(StringToLowercase(s[i]));
      }
      break;
    }
    case(21):  //----------------------------------------------
    {/*:InletTime [min]*/
      if (Options.noisy) {cout <<"Inlet time"<<endl;}
      if (Len<2){ImproperFormatWarning(":InletTime",p,Options.noisy); break;}
      AO.tc.t0_min=s_to_d(s[1]);
      break;
    }
    case(22):  //----------------------------------------------
    {/*:KirpichSurface [natural|grassy|concrete|...]*/
      if (Options.noisy) {cout <<"Kirpich surface"<<endl;}
      if (Len<2){ImproperFormatWarning(":KirpichSurface",p,Options.noisy); break;}
      AO.tc.kirpich_surface=StringToLowercase(s[1]);
      break;
    }
    case(23):  //----------------------------------------------
    {/*:NRCSSegments
       :SheetFlow   [length_m] [n] [slope] {P2_mm}
       :ShallowFlow [length_m] [slope] {surface}
       :ChannelFlow [length_m] [n] [slope] [hyd_radius_m]
       :EndNRCSSegments*/
      if (Options.noisy) {cout <<"NRCS segments"<<endl;}
      AO.tc.has_segments=true;
      if (!ParseNRCSSegments(p,AO.tc.segments,Options)){
        ExitGracefully("ParseAnalysisFile: :NRCSSegments block not terminated by :EndNRCSSegments",BAD_DATA);
      }
      break;
    }
    case(24):  //----------------------------------------------
    {/*:NRCSDefaultP2 [mm]*/
      if (Options.noisy) {cout <<"NRCS default P2"<<endl;}
      if (Len<2){ImproperFormatWarning(":NRCSDefaultP2",p,Options.noisy); break;}
      AO.tc.P2_mm=s_to_d(s[1]);
      break;
    }
    case(25):  //----------------------------------------------
    {/*:KinematicWave [mannings_n] [intensity_mmhr] {max_iter} {tol_hr}*/
      if (Options.noisy) {cout <<"Kinematic wave parameters"<<endl;}
      if (Len<3){ImproperFormatWarning(":KinematicWave",p,Options.noisy); break;}
      AO.tc.mannings_n    =s_to_d(s[1]);
      AO.tc.intensity_mmhr=s_to_d(s[2]);
      if (Len>=4){AO.tc.max_iter=s_to_i(s[3]);}
      if (Len>=5){AO.tc.tol_hr  =s_to_d(s[4]);}
      break;
    }
    case(30):  //----------------------------------------------
    {/*:StormCodes [code1] [code2] ...*/
      if (Options.noisy) {cout <<"Storm codes"<<endl;}
      if (Len<2){ImproperFormatWarning(":StormCodes",p,Options.noisy); break;}
      if (!storm_set){AO.storm_codes.clear();storm_set=true;}
      for (int i=1;i<Len;i++){
        StringToStormCode(s[i]); //validates
        AO.storm_codes.push_back(StringToLowercase(s[i]));
      }
      break;
    }
    case(31):  //----------------------------------------------
    {/*:ReturnPeriods [Tr1] [Tr2] ...*/
      if (Options.noisy) {cout <<"Return periods"<<endl;}
      if (Len<2){ImproperFormatWarning(":ReturnPeriods",p,Options.noisy); break;}
      if (!tr_set){AO.return_periods.clear();tr_set=true;}
      for (int i=1;i<Len;i++){
        double Tr=s_to_d(s[i]);
        ExitGracefullyIf(Tr<=0,"ParseAnalysisFile: :ReturnPeriods must be positive",BAD_DATA);
        AO.return_periods.push_back(Tr);
      }
      break;
    }
    case(32):  //----------------------------------------------
    {/*:XFactors [X1] [X2] ...*/
      if (Options.noisy) {cout <<"X factors"<<endl;}
      if (Len<2){ImproperFormatWarning(":XFactors",p,Options.noisy); break;}
      if (!x_set){AO.x_factors.clear();x_set=true;}
      for (int i=1;i<Len;i++){
        double X=s_to_d(s[i]);
        ExitGracefullyIf(X<1.0,"ParseAnalysisFile: :XFactors must be at least 1.0",BAD_DATA);
        AO.x_factors.push_back(X);
      }
      break;
    }
    case(33):  //----------------------------------------------
    {/*:TimeStep [min]*/
      if (Options.noisy) {cout <<"Time step"<<endl;}
      if (Len<2){ImproperFormatWarning(":TimeStep",p,Options.noisy); break;}
      AO.dt_min=s_to_d(s[1]);
      ExitGracefullyIf(AO.dt_min<=0,"ParseAnalysisFile: :TimeStep must be positive",BAD_DATA);
      break;
    }
    case(34):  //----------------------------------------------
    {/*:RunoffMethods [rational|scs_cn] ...*/
      if (Options.noisy) {cout <<"Runoff methods"<<endl;}
      if (Len<2){ImproperFormatWarning(":RunoffMethods",p,Options.noisy); break;}
      AO.runoff_methods.clear();
      for (int i=1;i<Len;i++){
        AO.runoff_methods.push_back(RunoffMethodToString(StringToRunoffMethod(s[i])));
      }
      break;
    }
    case(40):  //----------------------------------------------
    {/*:BimodalPeaks [p1] [p2]*/
      if (Options.noisy) {cout <<"Bimodal peaks"<<endl;}
      if (Len<3){ImproperFormatWarning(":BimodalPeaks",p,Options.noisy); break;}
      AO.storm.bimodal_peak1=s_to_d(s[1]);
      AO.storm.bimodal_peak2=s_to_d(s[2]);
      break;
    }
    case(41):  //----------------------------------------------
    {/*:BimodalVolumeSplit [fraction]*/
      if (Options.noisy) {cout <<"Bimodal volume split"<<endl;}
      if (Len<2){ImproperFormatWarning(":BimodalVolumeSplit",p,Options.noisy); break;}
      AO.storm.bimodal_volume_split=s_to_d(s[1]);
      break;
    }
    case(42):  //----------------------------------------------
    {/*:BimodalPeakWidth [fraction]*/
      if (Options.noisy) {cout <<"Bimodal peak width"<<endl;}
      if (Len<2){ImproperFormatWarning(":BimodalPeakWidth",p,Options.noisy); break;}
      AO.storm.bimodal_peak_width=s_to_d(s[1]);
      break;
    }
    case(43):  //----------------------------------------------
    {/*:BimodalDuration [hr]*/
      if (Options.noisy) {cout <<"Bimodal duration"<<endl;}
      if (Len<2){ImproperFormatWarning(":BimodalDuration",p,Options.noisy); break;}
      AO.storm.bimodal_duration_hr=s_to_d(s[1]);
      break;
    }
    case(50):  //----------------------------------------------
    {/*:CustomDepth [mm]*/
      if (Options.noisy) {cout <<"Custom storm depth"<<endl;}
      if (Len<2){ImproperFormatWarning(":CustomDepth",p,Options.noisy); break;}
      AO.storm.custom_depth_mm=s_to_d(s[1]);
      break;
    }
    case(51):  //----------------------------------------------
    {/*:CustomDistribution [name]*/
      if (Options.noisy) {cout <<"Custom storm distribution"<<endl;}
      if (Len<2){ImproperFormatWarning(":CustomDistribution",p,Options.noisy); break;}
      AO.storm.custom_distribution=StringToLowercase(s[1]);
      break;
    }
    case(52):  //----------------------------------------------
    {/*:CustomDuration [hr]*/
      if (Options.noisy) {cout <<"Custom storm duration"<<endl;}
      if (Len<2){ImproperFormatWarning(":CustomDuration",p,Options.noisy); break;}
      AO.storm.custom_duration_hr=s_to_d(s[1]);
      break;
    }
    case(53):  //----------------------------------------------
    {/*:CustomHyetograph
       [time_min] [depth_mm]
       ...
       :EndCustomHyetograph*/
      if (Options.noisy) {cout <<"Custom hyetograph"<<endl;}
      parse_error err=p->ParseColumns_dbldbl(AO.storm.custom_time_min,AO.storm.custom_depth_series,":EndCustomHyetograph");
      ExitGracefullyIf(err==PARSE_EOF,"ParseAnalysisFile: :CustomHyetograph block not terminated by :EndCustomHyetograph",BAD_DATA);
      ExitGracefullyIf(err==PARSE_BAD,"ParseAnalysisFile: :CustomHyetograph block must contain two columns (time, depth)",BAD_DATA);
      break;
    }
    case(60):  //----------------------------------------------
    {/*:AMC [I|II|III]*/
      if (Options.noisy) {cout <<"Antecedent moisture condition"<<endl;}
      if (Len<2){ImproperFormatWarning(":AMC",p,Options.noisy); break;}
      AO.amc=StringToAMC(s[1]);
      break;
    }
    case(61):  //----------------------------------------------
    {/*:Lambda [ratio]*/
      if (Options.noisy) {cout <<"Initial abstraction ratio"<<endl;}
      if (Len<2){ImproperFormatWarning(":Lambda",p,Options.noisy); break;}
      AO.lambda=s_to_d(s[1]);
      ExitGracefullyIf(AO.lambda<0,"ParseAnalysisFile: :Lambda cannot be negative",BAD_DATA);
      break;
    }
    case(70):  //----------------------------------------------
    {/*:CoverageTable [chow|fhwa|uruguay]*/
      if (Options.noisy) {cout <<"Coverage table"<<endl;}
      if (Len<2){ImproperFormatWarning(":CoverageTable",p,Options.noisy); break;}
      basin.c_table=StringToCoeffTable(s[1]);
      break;
    }
    case(71):  //----------------------------------------------
    {/*:Coverage [area_ha] [table_index | =value]*/
      if (Options.noisy) {cout <<"C coverage item"<<endl;}
      if (!ParseCoverageLine(s,Len,basin.c_coverage,":Coverage")){ImproperFormatWarning(":Coverage",p,Options.noisy);}
      break;
    }
    case(72):  //----------------------------------------------
    {/*:CNCoverage [area_ha] [table_index | =value]*/
      if (Options.noisy) {cout <<"CN coverage item"<<endl;}
      if (!ParseCoverageLine(s,Len,basin.cn_coverage,":CNCoverage")){ImproperFormatWarning(":CNCoverage",p,Options.noisy);}
      break;
    }
    case(80):  //----------------------------------------------
    {/*:UnitHydrograph [scs_triangular|scs_curvilinear|gamma|snyder|clark|triangular_x]*/
      if (Options.noisy) {cout <<"Unit hydrograph method"<<endl;}
      if (Len<2){ImproperFormatWarning(":UnitHydrograph",p,Options.noisy); break;}
      AO.uh_tag=UHMethodToString(StringToUHMethod(s[1]));
      break;
    }
    case(81):  //----------------------------------------------
    {/*:PeakRateFactor [PRF]*/
      if (Options.noisy) {cout <<"SCS peak rate factor"<<endl;}
      if (Len<2){ImproperFormatWarning(":PeakRateFactor",p,Options.noisy); break;}
      AO.uh.prf=s_to_d(s[1]);
      ExitGracefullyIf(AO.uh.prf<=0,"ParseAnalysisFile: :PeakRateFactor must be positive",BAD_DATA);
      break;
    }
    case(82):  //----------------------------------------------
    {/*:GammaShape [m]*/
      if (Options.noisy) {cout <<"Gamma unit hydrograph shape"<<endl;}
      if (Len<2){ImproperFormatWarning(":GammaShape",p,Options.noisy); break;}
      AO.uh.gamma_m=s_to_d(s[1]);
      ExitGracefullyIf(AO.uh.gamma_m<=0,"ParseAnalysisFile: :GammaShape must be positive",BAD_DATA);
      break;
    }
    case(83):  //----------------------------------------------
    {/*:SnyderCoefficients [Ct] [Cp]*/
      if (Options.noisy) {cout <<"Snyder coefficients"<<endl;}
      if (Len<3){ImproperFormatWarning(":SnyderCoefficients",p,Options.noisy); break;}
      AO.uh.Ct=s_to_d(s[1]);
      AO.uh.Cp=s_to_d(s[2]);
      ExitGracefullyIf((AO.uh.Ct<=0) || (AO.uh.Cp<=0),"ParseAnalysisFile: :SnyderCoefficients must be positive",BAD_DATA);
      break;
    }
    case(84):  //----------------------------------------------
    {/*:CentroidDistance [km]*/
      if (Options.noisy) {cout <<"Centroid distance"<<endl;}
      if (Len<2){ImproperFormatWarning(":CentroidDistance",p,Options.noisy); break;}
      AO.uh.lc_km=s_to_d(s[1]);
      ExitGracefullyIf(AO.uh.lc_km<=0,"ParseAnalysisFile: :CentroidDistance must be positive",BAD_DATA);
      break;
    }
    case(85):  //----------------------------------------------
    {/*:ClarkStorage [R_hr]*/
      if (Options.noisy) {cout <<"Clark storage coefficient"<<endl;}
      if (Len<2){ImproperFormatWarning(":ClarkStorage",p,Options.noisy); break;}
      AO.uh.R_hr=s_to_d(s[1]);
      ExitGracefullyIf(AO.uh.R_hr<=0,"ParseAnalysisFile: :ClarkStorage must be positive",BAD_DATA);
      break;
    }
    default://----------------------------------------------
    {
      char firstChar = *(s[0]);
      if (firstChar==':')
      {
        if     (!strcmp(s[0],":FileType"))    {if (Options.noisy){cout<<"Filetype"<<endl;    }}//do nothing
        else if(!strcmp(s[0],":Application")) {if (Options.noisy){cout<<"Application"<<endl; }}//do nothing
        else if(!strcmp(s[0],":Version"))     {if (Options.noisy){cout<<"Version"<<endl;     }}//do nothing
        else if(!strcmp(s[0],":WrittenBy"))   {if (Options.noisy){cout<<"WrittenBy"<<endl;   }}//do nothing
        else if(!strcmp(s[0],":CreationDate")){if (Options.noisy){cout<<"CreationDate"<<endl;}}//do nothing
        else
        {
          string warn ="IGNORING unrecognized command: " + string(s[0])+ " in .rvs file";
          WriteWarning(warn,Options.noisy);
        }
      }
      else
      {
        string errString = "Unrecognized command in .rvs file:\n   " + string(s[0]);
        ExitGracefully(errString.c_str(),BAD_DATA_WARN);
      }
      break;
    }
    }//switch

    end_of_file=p->Tokenize(s,Len);

    //return after file redirect, if in secondary file
    if ((end_of_file) && (pMainParser!=NULL))
    {
      INPUT2.clear();
      INPUT2.close();
      delete p;
      p=pMainParser;
      pMainParser=NULL;
      end_of_file=p->Tokenize(s,Len);
    }
  } //end while (!end_of_file)
  INPUT.close();
  delete p; p=NULL;

  //===============================================================================================
  //Coverage-weighted coefficients
  //===============================================================================================
  if (!basin.c_coverage.empty())
  {
    if (basin.area_ha!=PLV_BLANK_DATA){CheckCoverageArea(basin.c_coverage,basin.area_ha);}
    if (basin.C==PLV_BLANK_DATA){
      basin.C=RecalculateWeightedCForTr(basin.c_coverage,2.0,basin.c_table);
      if (!Options.silent){cout<<"  Area-weighted runoff coefficient (Tr=2): "<<FormatDoubleString(basin.C,3)<<endl;}
    }
  }
  if (!basin.cn_coverage.empty())
  {
    if (basin.area_ha!=PLV_BLANK_DATA){CheckCoverageArea(basin.cn_coverage,basin.area_ha);}
    if (basin.CN==PLV_BLANK_DATA){
      basin.CN=WeightedCNFromItems(basin.cn_coverage,basin.soil_group);
      if (!Options.silent){cout<<"  Area-weighted curve number: "<<FormatDoubleString(basin.CN,1)<<endl;}
    }
  }

  //===============================================================================================
  //Check input quality
  //===============================================================================================
  ExitGracefullyIf(basin.area_ha==PLV_BLANK_DATA,
                   "ParseAnalysisFile: basin :Area must be specified",BAD_DATA);
  ExitGracefullyIf((basin.C==PLV_BLANK_DATA) && (basin.CN==PLV_BLANK_DATA),
                   "ParseAnalysisFile: either :RunoffCoefficient or :CurveNumber (or coverage) must be specified",BAD_DATA);
  if (basin.P3_10==PLV_BLANK_DATA){
    WriteWarning("ParseAnalysisFile: neither :P3_10 nor :Department specified; DINAGUA-based storms will be skipped",Options.noisy);
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief reads NRCS segment lines until :EndNRCSSegments
/// \return false if end of file reached before end tag
//
bool ParseNRCSSegments(CParser *p, vector<nrcs_segment> &segments, const optStruct &Options)
{
  int   Len;
  char *s[MAXINPUTITEMS];
  segments.clear();
  while (!p->Tokenize(s,Len))
  {
    if      (IsComment(s[0],Len))                {}//comment or blank
    else if (!strcmp(s[0],":EndNRCSSegments"))   {return true;}
    else if (!strcmp(s[0],":SheetFlow"))
    {
      if (Len<4){ImproperFormatWarning(":SheetFlow",p,Options.noisy); continue;}
      double P2=(Len>=5) ? s_to_d(s[4]) : PLV_BLANK_DATA;
      segments.push_back(SheetFlowSegment(s_to_d(s[1]),s_to_d(s[2]),s_to_d(s[3]),P2));
    }
    else if (!strcmp(s[0],":ShallowFlow"))
    {
      if (Len<3){ImproperFormatWarning(":ShallowFlow",p,Options.noisy); continue;}
      shallow_surface surf=(Len>=4) ? StringToShallowSurface(s[3]) : SURFACE_UNPAVED;
      segments.push_back(ShallowFlowSegment(s_to_d(s[1]),s_to_d(s[2]),surf));
    }
    else if (!strcmp(s[0],":ChannelFlow"))
    {
      if (Len<5){ImproperFormatWarning(":ChannelFlow",p,Options.noisy); continue;}
      segments.push_back(ChannelFlowSegment(s_to_d(s[1]),s_to_d(s[2]),s_to_d(s[3]),s_to_d(s[4])));
    }
    else
    {
      WriteWarning("ParseNRCSSegments: IGNORING unrecognized segment type "+string(s[0]),Options.noisy);
    }
  }
  return false;
}

///////////////////////////////////////////////////////////////////
/// \brief reads coverage line; second item is table index, or =value for opaque coefficient
//
bool ParseCoverageLine(char **s, const int Len, vector<coverage_item> &items, const string command)
{
  if (Len<3){return false;}
  double area=s_to_d(s[1]);
  ExitGracefullyIf(area<=0,"ParseAnalysisFile: "+command+" area must be positive",BAD_DATA);
  if (s[2][0]=='='){
    items.push_back(CoverageOpaque(area,s_to_d(s[2]+1)));
  }
  else{
    ExitGracefullyIf(!StringIsDouble(s[2]),"ParseAnalysisFile: "+command+" expects table index or =value",BAD_DATA);
    items.push_back(CoverageFromTable(area,s_to_i(s[2])));
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief writes warning for improperly formatted command line
//
void ImproperFormatWarning(string command, CParser *p, bool noisy)
{
  string warn;
  warn=command+" command: improper line length at line "+to_string(p->GetLineNumber());
  WriteWarning(warn,noisy);
}

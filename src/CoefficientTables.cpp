/*----------------------------------------------------------------
  Pluvial Library Source Code
  Copyright (c) 2024-2026 the Pluvial Development Team
  ----------------------------------------------------------------
  CoefficientTables.cpp
  ----------------------------------------------------------------*/
#include "CoefficientTables.h"
#include "LookupTable.h"

/*****************************************************************
   Reference tables
------------------------------------------------------------------
******************************************************************/
struct chow_c_entry
{
  const char *category;
  const char *description;
  double      C[6];        ///< C at Tr=2,5,10,25,50,100 yr
};
struct fhwa_c_entry
{
  const char *category;
  const char *description;
  double      C_base;      ///< C for Tr<=10 yr
};
struct range_c_entry
{
  const char *category;
  const char *description;
  double      C_min;
  double      C_max;
  double      C_typical;   ///< 0 if not given
};
struct cn_entry
{
  const char *category;
  const char *description;
  const char *condition;
  double      CN[4];       ///< CN for hydrologic soil group A,B,C,D
};

const double CHOW_TR[6]={2,5,10,25,50,100};

const int NUM_CHOW=20;
const chow_c_entry CHOW_TABLE[NUM_CHOW]={
  {"Comercial",       "Centro comercial denso",  {0.75,0.80,0.85,0.88,0.90,0.95}},
  {"Comercial",       "Vecindario comercial",    {0.50,0.55,0.60,0.65,0.70,0.75}},
  {"Residencial",     "Unifamiliar",             {0.25,0.30,0.35,0.40,0.45,0.50}},
  {"Residencial",     "Multifamiliar separado",  {0.35,0.40,0.45,0.50,0.55,0.60}},
  {"Residencial",     "Multifamiliar adosado",   {0.45,0.50,0.55,0.60,0.65,0.70}},
  {"Residencial",     "Suburbano",               {0.20,0.25,0.30,0.35,0.40,0.45}},
  {"Residencial",     "Apartamentos",            {0.50,0.55,0.60,0.65,0.70,0.75}},
  {"Industrial",      "Liviana",                 {0.50,0.55,0.60,0.65,0.70,0.80}},
  {"Industrial",      "Pesada",                  {0.60,0.65,0.70,0.75,0.80,0.85}},
  {"Superficies",     "Pavimento asfaltico",     {0.70,0.75,0.80,0.85,0.90,0.95}},
  {"Superficies",     "Pavimento concreto",      {0.75,0.80,0.85,0.90,0.92,0.95}},
  {"Superficies",     "Techos",                  {0.75,0.80,0.85,0.90,0.92,0.95}},
  {"Superficies",     "Adoquin con juntas",      {0.50,0.55,0.60,0.65,0.70,0.75}},
  {"Superficies",     "Grava/Macadam",           {0.25,0.30,0.35,0.40,0.45,0.50}},
  {"Cesped arenoso",  "Plano (<2%)",             {0.05,0.08,0.10,0.13,0.15,0.18}},
  {"Cesped arenoso",  "Medio (2-7%)",            {0.10,0.13,0.16,0.19,0.22,0.25}},
  {"Cesped arenoso",  "Fuerte (>7%)",            {0.15,0.18,0.21,0.25,0.29,0.32}},
  {"Cesped arcilloso","Plano (<2%)",             {0.13,0.16,0.19,0.23,0.26,0.29}},
  {"Cesped arcilloso","Medio (2-7%)",            {0.18,0.21,0.25,0.29,0.34,0.37}},
  {"Cesped arcilloso","Fuerte (>7%)",            {0.25,0.29,0.34,0.40,0.44,0.50}}
};

const int NUM_FHWA=19;
const fhwa_c_entry FHWA_TABLE[NUM_FHWA]={
  {"Comercial",       "Centro comercial/negocios",       0.85},
  {"Comercial",       "Vecindario comercial",            0.60},
  {"Industrial",      "Industria liviana",               0.65},
  {"Industrial",      "Industria pesada",                0.75},
  {"Residencial",     "Unifamiliar (lotes >1000 m2)",    0.40},
  {"Residencial",     "Unifamiliar (lotes 500-1000 m2)", 0.50},
  {"Residencial",     "Unifamiliar (lotes <500 m2)",     0.60},
  {"Residencial",     "Multifamiliar/Apartamentos",      0.70},
  {"Residencial",     "Condominios/Townhouse",           0.60},
  {"Superficies",     "Asfalto/Concreto",                0.85},
  {"Superficies",     "Adoquin/Ladrillo",                0.78},
  {"Superficies",     "Techos",                          0.85},
  {"Superficies",     "Grava/Ripio",                     0.32},
  {"Cesped arenoso",  "Pendiente plana <2%",             0.08},
  {"Cesped arenoso",  "Pendiente media 2-7%",            0.12},
  {"Cesped arenoso",  "Pendiente alta >7%",              0.18},
  {"Cesped arcilloso","Pendiente plana <2%",             0.15},
  {"Cesped arcilloso","Pendiente media 2-7%",            0.20},
  {"Cesped arcilloso","Pendiente alta >7%",              0.28}
};

const int NUM_URUGUAY=14;
const range_c_entry URUGUAY_TABLE[NUM_URUGUAY]={
  {"Urbano",      "Centro ciudad (muy denso)",  0.70,0.90,0.80},
  {"Urbano",      "Comercial/Mixto",            0.60,0.80,0.70},
  {"Urbano",      "Residencial alta densidad",  0.50,0.70,0.60},
  {"Urbano",      "Residencial media densidad", 0.40,0.60,0.50},
  {"Urbano",      "Residencial baja densidad",  0.30,0.50,0.40},
  {"Urbano",      "Industrial",                 0.60,0.85,0.72},
  {"Superficies", "Calles pavimentadas",        0.80,0.95,0.88},
  {"Superficies", "Veredas/Patios",             0.75,0.90,0.82},
  {"Superficies", "Techos",                     0.80,0.95,0.88},
  {"Superficies", "Estacionamientos",           0.75,0.90,0.82},
  {"Superficies", "Tierra/Tosca compactada",    0.30,0.50,0.40},
  {"Areas verdes","Plazas/Parques",             0.10,0.25,0.18},
  {"Areas verdes","Jardines/Cesped",            0.08,0.18,0.12},
  {"Areas verdes","Baldios con vegetacion",     0.15,0.35,0.25}
};

const int NUM_CN_URBAN=13;
const int NUM_CN=27;
const cn_entry CN_TABLE[NUM_CN]={
  //urban (TR-55 table 2-2a)
  {"Residencial",      "Lotes 500 m2 (65% impermeable)",   "N/A",    {77,85,90,92}},
  {"Residencial",      "Lotes 1000 m2 (38% impermeable)",  "N/A",    {61,75,83,87}},
  {"Residencial",      "Lotes 1500 m2 (30% impermeable)",  "N/A",    {57,72,81,86}},
  {"Residencial",      "Lotes 2000 m2 (25% impermeable)",  "N/A",    {54,70,80,85}},
  {"Residencial",      "Lotes 4000 m2 (20% impermeable)",  "N/A",    {51,68,79,84}},
  {"Comercial",        "Distritos comerciales (85% imp)",  "N/A",    {89,92,94,95}},
  {"Industrial",       "Distritos industriales (72% imp)", "N/A",    {81,88,91,93}},
  {"Superficies",      "Pavimento impermeable",            "N/A",    {98,98,98,98}},
  {"Superficies",      "Grava",                            "N/A",    {76,85,89,91}},
  {"Superficies",      "Tierra",                           "N/A",    {72,82,87,89}},
  {"Espacios abiertos","Cesped >75% cubierto",             "Buena",  {39,61,74,80}},
  {"Espacios abiertos","Cesped 50-75% cubierto",           "Regular",{49,69,79,84}},
  {"Espacios abiertos","Cesped <50% cubierto",             "Mala",   {68,79,86,89}},
  //agricultural (TR-55 tables 2-2b, 2-2c)
  {"Barbecho",         "Suelo desnudo",                    "N/A",    {77,86,91,94}},
  {"Cultivos",         "Hileras rectas",                   "Mala",   {72,81,88,91}},
  {"Cultivos",         "Hileras rectas",                   "Buena",  {67,78,85,89}},
  {"Cultivos",         "Hileras en contorno",              "Mala",   {70,79,84,88}},
  {"Cultivos",         "Hileras en contorno",              "Buena",  {65,75,82,86}},
  {"Cultivos",         "Terrazas",                         "Mala",   {66,74,80,82}},
  {"Cultivos",         "Terrazas",                         "Buena",  {62,71,78,81}},
  {"Pasturas",         "Continua",                         "Mala",   {68,79,86,89}},
  {"Pasturas",         "Continua",                         "Regular",{49,69,79,84}},
  {"Pasturas",         "Continua",                         "Buena",  {39,61,74,80}},
  {"Pradera",          "Natural",                          "Buena",  {30,58,71,78}},
  {"Bosque",           "Con mantillo",                     "Mala",   {45,66,77,83}},
  {"Bosque",           "Con mantillo",                     "Regular",{36,60,73,79}},
  {"Bosque",           "Con mantillo",                     "Buena",  {30,55,70,77}}
};

//////////////////////////////////////////////////////////////////
coverage_item CoverageFromTable(const double &area_ha, const int table_index, const double &value)
{
  coverage_item item;
  item.area_ha    =area_ha;
  item.source     =COVERAGE_FROM_TABLE;
  item.table_index=table_index;
  item.value      =value;
  return item;
}
//////////////////////////////////////////////////////////////////
coverage_item CoverageOpaque(const double &area_ha, const double &value)
{
  coverage_item item;
  item.area_ha    =area_ha;
  item.source     =COVERAGE_OPAQUE;
  item.table_index=DOESNT_EXIST;
  item.value      =value;
  return item;
}

/*****************************************************************
   Table access
------------------------------------------------------------------
******************************************************************/
int GetNumTableEntries(const coeff_table table)
{
  switch(table)
  {
    case(TABLE_CHOW):    {return NUM_CHOW;}
    case(TABLE_FHWA):    {return NUM_FHWA;}
    case(TABLE_URUGUAY): {return NUM_URUGUAY;}
  }
  return 0;
}
//////////////////////////////////////////////////////////////////
/// \brief returns "category - description" for table row
//
string GetTableEntryName(const coeff_table table, const int index)
{
  ExitGracefullyIf((index<0) || (index>=GetNumTableEntries(table)),
    "GetTableEntryName: index "+to_string(index)+" out of range for table "+CoeffTableToString(table),BAD_DATA);
  switch(table)
  {
    case(TABLE_CHOW):    {return string(CHOW_TABLE   [index].category)+" - "+CHOW_TABLE   [index].description;}
    case(TABLE_FHWA):    {return string(FHWA_TABLE   [index].category)+" - "+FHWA_TABLE   [index].description;}
    case(TABLE_URUGUAY): {return string(URUGUAY_TABLE[index].category)+" - "+URUGUAY_TABLE[index].description;}
  }
  return "";
}
//////////////////////////////////////////////////////////////////
coeff_table StringToCoeffTable(const string s)
{
  string str=StringToUppercase(s);
  if      (str=="CHOW")   {return TABLE_CHOW;}
  else if (str=="FHWA")   {return TABLE_FHWA;}
  else if (str=="URUGUAY"){return TABLE_URUGUAY;}
  ExitGracefully("StringToCoeffTable: unknown coefficient table "+s,BAD_DATA);
  return TABLE_CHOW;
}
//////////////////////////////////////////////////////////////////
string CoeffTableToString(const coeff_table table)
{
  switch(table)
  {
    case(TABLE_CHOW):    {return "chow";}
    case(TABLE_FHWA):    {return "fhwa";}
    case(TABLE_URUGUAY): {return "uruguay";}
  }
  return "unknown";
}

//////////////////////////////////////////////////////////////////
/// \brief Ven Te Chow C, linearly interpolated in Tr, held constant outside 2-100 yr
//
double GetChowC(const int index, const double &Tr)
{
  ExitGracefullyIf((index<0) || (index>=NUM_CHOW),"GetChowC: index "+to_string(index)+" out of range",BAD_DATA);
  return InterpolateClamped(Tr,CHOW_TR,CHOW_TABLE[index].C,6);
}
//////////////////////////////////////////////////////////////////
/// \brief FHWA HEC-22 frequency factor; 1.0 for Tr<=10, 1.1 at 25, 1.2 at 50, 1.25 at 100 and above
//
double FHWAFrequencyFactor(const double &Tr)
{
  if      (Tr<=10) {return 1.0;}
  else if (Tr<=25) {return 1.0 +0.1 *(Tr-10)/15.0;}
  else if (Tr<=50) {return 1.1 +0.1 *(Tr-25)/25.0;}
  else if (Tr<=100){return 1.2 +0.05*(Tr-50)/50.0;}
  return 1.25;
}
//////////////////////////////////////////////////////////////////
double GetFHWAC(const int index, const double &Tr)
{
  ExitGracefullyIf((index<0) || (index>=NUM_FHWA),"GetFHWAC: index "+to_string(index)+" out of range",BAD_DATA);
  return min(FHWA_TABLE[index].C_base*FHWAFrequencyFactor(Tr),1.0);
}
//////////////////////////////////////////////////////////////////
/// \brief recommended regional C (typical value, or midpoint of range)
//
double GetUruguayC(const int index)
{
  ExitGracefullyIf((index<0) || (index>=NUM_URUGUAY),"GetUruguayC: index "+to_string(index)+" out of range",BAD_DATA);
  const range_c_entry &e=URUGUAY_TABLE[index];
  if (e.C_typical>0){return e.C_typical;}
  return 0.5*(e.C_min+e.C_max);
}
//////////////////////////////////////////////////////////////////
/// \brief C for return period Tr from original table row
//
double GetCForTrFromTable(const coeff_table table, const int index, const double &Tr)
{
  switch(table)
  {
    case(TABLE_CHOW):    {return GetChowC(index,Tr);}
    case(TABLE_FHWA):    {return GetFHWAC(index,Tr);}
    case(TABLE_URUGUAY): {return GetUruguayC(index);}
  }
  ExitGracefully("GetCForTrFromTable: unknown table",BAD_DATA);
  return 0.0;
}

//////////////////////////////////////////////////////////////////
int GetNumCNEntries     (){return NUM_CN;}
int GetNumUrbanCNEntries(){return NUM_CN_URBAN;}
//////////////////////////////////////////////////////////////////
string GetCNEntryName(const int index)
{
  ExitGracefullyIf((index<0) || (index>=NUM_CN),"GetCNEntryName: index "+to_string(index)+" out of range",BAD_DATA);
  string name=string(CN_TABLE[index].category)+" - "+CN_TABLE[index].description;
  if (strcmp(CN_TABLE[index].condition,"N/A")){name+=" ("+string(CN_TABLE[index].condition)+")";}
  return name;
}
//////////////////////////////////////////////////////////////////
/// \brief curve number for table row and hydrologic soil group
/// \param soil_group [in] "A","B","C" or "D"; unrecognized groups use B
//
double GetCN(const int index, const string soil_group)
{
  ExitGracefullyIf((index<0) || (index>=NUM_CN),"GetCN: index "+to_string(index)+" out of range",BAD_DATA);
  string str=StringToUppercase(soil_group);
  int g=1;
  if      (str=="A"){g=0;}
  else if (str=="B"){g=1;}
  else if (str=="C"){g=2;}
  else if (str=="D"){g=3;}
  return CN_TABLE[index].CN[g];
}

/*****************************************************************
   Adjustment and weighting
------------------------------------------------------------------
******************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief adjusts C from base return period to Tr using mean Chow table ratios
/// \param C_base [in] coefficient at base_Tr
/// \param Tr [in] target return period [yr]
/// \param base_Tr [in] return period of C_base [yr]
/// \return adjusted C, at most 1
//
double AdjustCForTr(const double &C_base, const double &Tr, const double &base_Tr)
{
  if (Tr==base_Tr){return C_base;}

  const double aTr[6]    ={2,   5,   10,  25,  50,  100};
  const double aFactor[6]={1.00,1.17,1.33,1.50,1.66,1.84};
  static const CLookupTable factors("C frequency factor",aTr,aFactor,6);

  double C=C_base*factors.GetValue(Tr)/factors.GetValue(base_Tr);
  return min(C,1.0);
}
//////////////////////////////////////////////////////////////////
/// \brief area-weighted mean of coefficient values (C or CN)
//
double WeightedCoefficient(const vector<double> &areas, const vector<double> &values)
{
  ExitGracefullyIf(areas.size()!=values.size(),"WeightedCoefficient: areas and values must have equal length",BAD_DATA);
  double total=0.0,sum=0.0;
  for (int i=0;i<(int)(areas.size());i++){
    total+=areas[i];
    sum  +=areas[i]*values[i];
  }
  ExitGracefullyIf(total==0.0,"WeightedCoefficient: total area cannot be zero",BAD_DATA);
  return sum/total;
}
//////////////////////////////////////////////////////////////////
/// \brief area-weighted C at return period Tr
/// \details items from the table use the exact table value at Tr; opaque items keep their value
//
double RecalculateWeightedCForTr(const vector<coverage_item> &items, const double &Tr, const coeff_table table)
{
  ExitGracefullyIf(items.empty(),"RecalculateWeightedCForTr: coverage list cannot be empty",BAD_DATA);
  vector<double> areas,values;
  for (int i=0;i<(int)(items.size());i++)
  {
    areas.push_back(items[i].area_ha);
    if (items[i].source==COVERAGE_FROM_TABLE){values.push_back(GetCForTrFromTable(table,items[i].table_index,Tr));}
    else                                     {values.push_back(items[i].value);}
  }
  return WeightedCoefficient(areas,values);
}
//////////////////////////////////////////////////////////////////
/// \brief area-weighted CN for a soil group
//
double WeightedCNFromItems(const vector<coverage_item> &items, const string soil_group)
{
  ExitGracefullyIf(items.empty(),"WeightedCNFromItems: coverage list cannot be empty",BAD_DATA);
  vector<double> areas,values;
  for (int i=0;i<(int)(items.size());i++)
  {
    areas.push_back(items[i].area_ha);
    if (items[i].source==COVERAGE_FROM_TABLE){values.push_back(GetCN(items[i].table_index,soil_group));}
    else                                     {values.push_back(items[i].value);}
  }
  return WeightedCoefficient(areas,values);
}
//////////////////////////////////////////////////////////////////
/// \brief warns if total coverage area exceeds basin area by more than 1%
//
void CheckCoverageArea(const vector<coverage_item> &items, const double &basin_area_ha)
{
  if (basin_area_ha==PLV_BLANK_DATA){return;}
  double total=0.0;
  for (int i=0;i<(int)(items.size());i++){total+=items[i].area_ha;}
  if (total>1.01*basin_area_ha){
    WriteWarning("CheckCoverageArea: total coverage area ("+FormatDoubleString(total,2)+" ha) exceeds basin area ("
                 +FormatDoubleString(basin_area_ha,2)+" ha)",false);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief converts AMC II curve number to dry (I) or wet (III) condition
/// \return adjusted CN, limited to [30,100]
//
double AdjustCNForAMC(const double &CN, const amc_type amc)
{
  ExitGracefullyIf((CN<30) || (CN>100),"AdjustCNForAMC: CN must be between 30 and 100",BAD_DATA);
  double CNadj=CN;
  switch(amc)
  {
    case(AMC_I):   {CNadj=CN/(2.281-0.01281*CN);break;}
    case(AMC_II):  {return CN;}
    case(AMC_III): {CNadj=CN/(0.427+0.00573*CN);break;}
  }
  return max(30.0,min(100.0,CNadj));
}
//////////////////////////////////////////////////////////////////
amc_type StringToAMC(const string s)
{
  string str=StringToUppercase(s);
  if      ((str=="I")   || (str=="1") || (str=="DRY"))    {return AMC_I;}
  else if ((str=="II")  || (str=="2") || (str=="AVERAGE")){return AMC_II;}
  else if ((str=="III") || (str=="3") || (str=="WET"))    {return AMC_III;}
  ExitGracefully("StringToAMC: unknown antecedent moisture condition "+s,BAD_DATA);
  return AMC_II;
}
//////////////////////////////////////////////////////////////////
string AMCToString(const amc_type amc)
{
  switch(amc)
  {
    case(AMC_I):   {return "I";}
    case(AMC_II):  {return "II";}
    case(AMC_III): {return "III";}
  }
  return "II";
}

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "PluvialInclude.h"
#include "IDFCurves.h"
#include "TimeOfConcentration.h"
#include "RainfallExcess.h"
#include "PluvialMain.h"
#include "DistributionRegistry.h"

namespace py = pybind11;

/////////////////////////////////////////////////////////////////
/// \brief parses .rvs file, runs every analysis combination and returns analyses as JSON text
//
string RunAnalysisFile(const string rvs_filename, const string data_dir)
{
  optStruct        Options;
  basin_params     basin;
  analysis_options AO;

  Options.version        =__PLUVIAL_VERSION__;
  Options.rvs_filename   =rvs_filename;
  Options.data_dir       =(data_dir=="") ? CDistributionRegistry::GetDefaultDataDirectory() : data_dir;
  Options.output_dir     ="";
  Options.main_output_dir="";
  Options.silent=true;
  Options.noisy =false;
  Options.pause =false;

  if (!ParseAnalysisFile(basin,AO,Options)){
    ExitGracefully("RunAnalysisFile: unable to read input file "+rvs_filename,BAD_DATA);}

  CDistributionRegistry Registry(Options.data_dir);
  CAnalysisRunner       Runner(basin,AO,Registry);
  Runner.Run();

  nlohmann::json J=nlohmann::json::array();
  for (int i=0;i<Runner.GetNumRuns();i++){
    J.push_back(AnalysisRunToJSON(Runner.GetRun(i)));
  }
  return J.dump();
}

PYBIND11_MODULE(libpluvial, m) {
    m.doc() =
      R"pbdoc(A Python wrapper to the Pluvial design storm and peak flow engine.)pbdoc";

    m.attr("__version__") = __PLUVIAL_VERSION__;

    py::register_exception<CPluvialException>(m, "PluvialError");

    m.def("dinagua_depth", &DinaguaDepth,
          py::arg("P3_10"), py::arg("Tr"), py::arg("duration_hr"), py::arg("area_km2")=PLV_BLANK_DATA);
    m.def("dinagua_intensity", &DinaguaIntensity,
          py::arg("P3_10"), py::arg("Tr"), py::arg("duration_hr"), py::arg("area_km2")=PLV_BLANK_DATA);
    m.def("department_p3_10", &GetDepartmentP3_10, py::arg("department"));

    m.def("tc_kirpich", &TcKirpich,
          py::arg("length_m"), py::arg("slope"), py::arg("surface")="natural");
    m.def("tc_temez", &TcTemez, py::arg("length_km"), py::arg("slope"));
    m.def("tc_california", &TcCalifornia, py::arg("length_km"), py::arg("elev_drop_m"));
    m.def("tc_desbordes", &TcDesbordes,
          py::arg("area_ha"), py::arg("slope_pct"), py::arg("C"), py::arg("t0_min")=DEFAULT_INLET_TIME);

    m.def("scs_runoff", &SCSRunoff,
          py::arg("P_mm"), py::arg("CN"), py::arg("ia_ratio")=DEFAULT_LAMBDA);
    m.def("rational_peak_flow", &RationalPeakFlow,
          py::arg("C"), py::arg("intensity_mmhr"), py::arg("area_ha"), py::arg("Tr")=10.0);

    m.def("run_analysis_file", &RunAnalysisFile,
          py::arg("rvs_filename"), py::arg("data_dir")="",
          R"pbdoc(Runs all analyses of an .rvs file; returns JSON array text.)pbdoc");
}

/*
  Pybind11 module exposing edgetrp-core C++ APIs to Python.

  Notes:
    - Per-node arrays are accepted as C-contiguous float64 NumPy arrays and
      viewed as spans without copying.
    - Topology views are returned as NumPy arrays that keep the owning
      topology alive.
    - Core exceptions map to Python classes of the same name; model errors
      derive from ModelError, which carries region, node and year.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "edgetrp/core/calibrator.hpp"
#include "edgetrp/core/clustering.hpp"
#include "edgetrp/core/config.hpp"
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"
#include "edgetrp/core/nest_topology.hpp"
#include "edgetrp/core/preference_trend.hpp"
#include "edgetrp/core/projection.hpp"
#include "edgetrp/core/share_evaluator.hpp"
#include "edgetrp/core/tables.hpp"
#include "edgetrp/core/types.hpp"
#include "edgetrp/core/vintage_tracker.hpp"

namespace py = pybind11;
using namespace edgetrp::core;

// Helpers to check NumPy arrays
template <typename T>
static std::span<const T> as_span(const py::array& arr, const char* name) {
  if (!py::isinstance<py::array_t<T>>(arr)) {
    throw py::type_error(std::string(name) + ": expected numpy array of correct dtype");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error(std::string(name) + ": array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 1) throw py::type_error(std::string(name) + ": expected a 1-D array");
  return std::span<const T>(static_cast<const T*>(buf.ptr), static_cast<std::size_t>(buf.size));
}

// NumPy view over a span owned by `owner` (no copy).
template <typename T>
static py::array view_of(py::object owner, std::span<const T> s) {
  py::array arr(
      py::buffer_info(
          const_cast<T*>(s.data()),
          sizeof(T),
          py::format_descriptor<T>::format(),
          1,
          { s.size() },
          { sizeof(T) }
      ),
      owner);
  return arr;
}

// Lets Python classes implement IndicatorSource. The override takes the GIL,
// so run_projection may call it with the GIL released.
class PyIndicatorSource : public IndicatorSource {
 public:
  using IndicatorSource::IndicatorSource;
  std::optional<double> indicator(const std::string& region) const override {
    PYBIND11_OVERRIDE_PURE(std::optional<double>, IndicatorSource, indicator, region);
  }
};

PYBIND11_MODULE(_edgetrp_core, m) {
  m.doc() = "edgetrp-core C++ bindings";

  // Exceptions: bases first so derived translators take precedence.
  auto& value_exc = py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<ConfigError>(m, "ConfigError", value_exc.ptr());
  auto& model_exc = py::register_exception<ModelError>(m, "ModelError", PyExc_RuntimeError);
  py::register_exception<MissingPriceError>(m, "MissingPriceError", model_exc.ptr());
  py::register_exception<DegenerateNestError>(m, "DegenerateNestError", model_exc.ptr());
  py::register_exception<CalibrationDataGapError>(m, "CalibrationDataGapError", model_exc.ptr());
  py::register_exception<FleetIntegrityError>(m, "FleetIntegrityError", model_exc.ptr());
  py::register_exception<ClusteringIndicatorMissingError>(m, "ClusteringIndicatorMissingError", model_exc.ptr());

  m.def("init_logging",
        [](const std::string& level, const std::string& log_file) {
          init_logging(spdlog::level::from_str(level), log_file);
        },
        py::arg("level") = "info", py::arg("log_file") = "");

  py::enum_<CalibrationMode>(m, "CalibrationMode")
      .value("PREFERENCE_ONLY", CalibrationMode::PreferenceOnly)
      .value("INCONVENIENCE", CalibrationMode::Inconvenience);

  py::enum_<ConvergenceLaw>(m, "ConvergenceLaw")
      .value("LOGISTIC", ConvergenceLaw::Logistic)
      .value("EXPONENTIAL", ConvergenceLaw::Exponential)
      .value("LINEAR", ConvergenceLaw::Linear);

  // ---- options and configuration ----
  py::class_<EvaluationOptions>(m, "EvaluationOptions")
      .def(py::init<>())
      .def_readwrite("require_prices", &EvaluationOptions::require_prices);
  py::class_<CalibrationOptions>(m, "CalibrationOptions")
      .def(py::init<>())
      .def_readwrite("preference_floor", &CalibrationOptions::preference_floor)
      .def_readwrite("evaluation", &CalibrationOptions::evaluation);
  py::class_<ClusteringOptions>(m, "ClusteringOptions")
      .def(py::init<>())
      .def_readwrite("num_clusters", &ClusteringOptions::num_clusters)
      .def_readwrite("log_transform", &ClusteringOptions::log_transform);
  py::class_<TrendOptions>(m, "TrendOptions")
      .def(py::init<>())
      .def_readwrite("preference_floor", &TrendOptions::preference_floor)
      .def_readwrite("default_convergence_year", &TrendOptions::default_convergence_year)
      .def_readwrite("default_rate", &TrendOptions::default_rate)
      .def_readwrite("default_law", &TrendOptions::default_law)
      .def_readwrite("smart_lifestyle", &TrendOptions::smart_lifestyle)
      .def_readwrite("lifestyle_multiplier", &TrendOptions::lifestyle_multiplier)
      .def_readwrite("lifestyle_nodes", &TrendOptions::lifestyle_nodes)
      .def_readwrite("techswitch", &TrendOptions::techswitch)
      .def_readwrite("techswitch_multiplier", &TrendOptions::techswitch_multiplier)
      .def_readwrite("inconvenience", &TrendOptions::inconvenience);
  py::class_<VintageOptions>(m, "VintageOptions")
      .def(py::init<>())
      .def_readwrite("initial_vintage_step", &VintageOptions::initial_vintage_step);

  py::class_<ScenarioConfig>(m, "ScenarioConfig")
      .def(py::init<>())
      .def_static("for_scenario", &ScenarioConfig::for_scenario, py::arg("name"))
      .def_static("from_yaml_file", &ScenarioConfig::from_yaml_file, py::arg("path"))
      .def_static("from_yaml_string", &ScenarioConfig::from_yaml_string, py::arg("text"))
      .def_static("default_years", &ScenarioConfig::default_years)
      .def("validate", &ScenarioConfig::validate)
      .def_readwrite("name", &ScenarioConfig::name)
      .def_readwrite("mode", &ScenarioConfig::mode)
      .def_readwrite("years", &ScenarioConfig::years)
      .def_readwrite("reference_years", &ScenarioConfig::reference_years)
      .def_readwrite("evaluation", &ScenarioConfig::evaluation)
      .def_readwrite("calibration", &ScenarioConfig::calibration)
      .def_readwrite("clustering", &ScenarioConfig::clustering)
      .def_readwrite("trend", &ScenarioConfig::trend)
      .def_readwrite("vintage", &ScenarioConfig::vintage);

  // ---- topology ----
  py::class_<NestNodeSpec>(m, "NestNodeSpec")
      .def(py::init([](std::string key, std::string parent_key, double exponent,
                       std::string vehicle_type, std::string technology, std::string carrier) {
        return NestNodeSpec{std::move(key), std::move(parent_key), exponent,
                            std::move(vehicle_type), std::move(technology), std::move(carrier)};
      }),
        py::arg("key"), py::arg("parent_key") = "", py::kw_only(), py::arg("exponent") = 1.0,
        py::arg("vehicle_type") = "", py::arg("technology") = "", py::arg("carrier") = "")
      .def_readwrite("key", &NestNodeSpec::key)
      .def_readwrite("parent_key", &NestNodeSpec::parent_key)
      .def_readwrite("exponent", &NestNodeSpec::exponent)
      .def_readwrite("vehicle_type", &NestNodeSpec::vehicle_type)
      .def_readwrite("technology", &NestNodeSpec::technology)
      .def_readwrite("carrier", &NestNodeSpec::carrier);

  py::class_<NestTopology, std::shared_ptr<NestTopology>>(m, "NestTopology")
      .def_static("from_nodes",
                  [](std::string sector, const std::vector<NestNodeSpec>& nodes, bool value_of_time) {
                    return std::make_shared<NestTopology>(
                        NestTopology::from_nodes(std::move(sector), nodes, value_of_time));
                  },
                  py::arg("sector"), py::arg("nodes"), py::kw_only(), py::arg("value_of_time") = false)
      .def("num_nodes", &NestTopology::num_nodes)
      .def("root", &NestTopology::root)
      .def("sector", &NestTopology::sector)
      .def("uses_value_of_time", &NestTopology::uses_value_of_time)
      .def("is_leaf", &NestTopology::is_leaf, py::arg("node"))
      .def("key", &NestTopology::key, py::arg("node"))
      .def("vehicle_type", &NestTopology::vehicle_type, py::arg("node"))
      .def("technology", &NestTopology::technology, py::arg("node"))
      .def("carrier", &NestTopology::carrier, py::arg("node"))
      .def("find", &NestTopology::find, py::arg("key"))
      .def("find_leaf", &NestTopology::find_leaf, py::arg("vehicle_type"), py::arg("technology"))
      .def("parent_view", [](py::object self) { return view_of(self, self.cast<const NestTopology&>().parent_view()); })
      .def("level_view", [](py::object self) { return view_of(self, self.cast<const NestTopology&>().level_view()); })
      .def("exponent_view", [](py::object self) { return view_of(self, self.cast<const NestTopology&>().exponent_view()); })
      .def("child_offsets_view", [](py::object self) { return view_of(self, self.cast<const NestTopology&>().child_offsets_view()); })
      .def("children_view", [](py::object self) { return view_of(self, self.cast<const NestTopology&>().children_view()); })
      .def("leaves_view", [](py::object self) { return view_of(self, self.cast<const NestTopology&>().leaves_view()); });

  // ---- tables ----
  py::class_<PriceRecord>(m, "PriceRecord")
      .def(py::init([](double non_fuel_cost, double fuel_cost, double energy_intensity) {
        return PriceRecord{non_fuel_cost, fuel_cost, energy_intensity};
      }), py::arg("non_fuel_cost"), py::arg("fuel_cost"), py::arg("energy_intensity"))
      .def_readwrite("non_fuel_cost", &PriceRecord::non_fuel_cost)
      .def_readwrite("fuel_cost", &PriceRecord::fuel_cost)
      .def_readwrite("energy_intensity", &PriceRecord::energy_intensity);

  py::class_<PriceTable, std::shared_ptr<PriceTable>>(m, "PriceTable")
      .def(py::init<>())
      .def("insert", &PriceTable::insert,
           py::arg("region"), py::arg("vehicle_type"), py::arg("technology"), py::arg("year"), py::arg("record"))
      .def("find", [](const PriceTable& t, const std::string& r, const std::string& vt, const std::string& tech, Year y)
                       -> std::optional<PriceRecord> {
             const PriceRecord* rec = t.find(r, vt, tech, y);
             if (rec == nullptr) return std::nullopt;
             return *rec;
           }, py::arg("region"), py::arg("vehicle_type"), py::arg("technology"), py::arg("year"))
      .def("__len__", &PriceTable::size);

  py::class_<ValueOfTimeTable, std::shared_ptr<ValueOfTimeTable>>(m, "ValueOfTimeTable")
      .def(py::init<>())
      .def("insert", &ValueOfTimeTable::insert,
           py::arg("region"), py::arg("vehicle_type"), py::arg("year"), py::arg("time_cost"))
      .def("find", &ValueOfTimeTable::find, py::arg("region"), py::arg("vehicle_type"), py::arg("year"))
      .def("__len__", &ValueOfTimeTable::size);

  py::class_<CostAdjustmentTable, std::shared_ptr<CostAdjustmentTable>>(m, "CostAdjustmentTable")
      .def(py::init<>())
      .def("insert", &CostAdjustmentTable::insert,
           py::arg("region"), py::arg("vehicle_type"), py::arg("technology"), py::arg("year"), py::arg("adjustment"))
      .def("find", &CostAdjustmentTable::find,
           py::arg("region"), py::arg("vehicle_type"), py::arg("technology"), py::arg("year"))
      .def("__len__", &CostAdjustmentTable::size);

  py::class_<ObservedShareTable, std::shared_ptr<ObservedShareTable>>(m, "ObservedShareTable")
      .def(py::init<>())
      .def("insert", &ObservedShareTable::insert,
           py::arg("region"), py::arg("vehicle_type"), py::arg("technology"), py::arg("reference_year"), py::arg("observed"))
      .def("find", &ObservedShareTable::find,
           py::arg("region"), py::arg("vehicle_type"), py::arg("technology"), py::arg("reference_year"))
      .def("__len__", &ObservedShareTable::size);

  py::class_<DemandSeries, std::shared_ptr<DemandSeries>>(m, "DemandSeries")
      .def(py::init<>())
      .def("insert", &DemandSeries::insert, py::arg("region"), py::arg("year"), py::arg("demand"))
      .def("find", &DemandSeries::find, py::arg("region"), py::arg("year"))
      .def("__len__", &DemandSeries::size);

  // ---- share evaluation ----
  py::class_<LeafCosts>(m, "LeafCosts")
      .def_readonly("region", &LeafCosts::region)
      .def_readonly("year", &LeafCosts::year)
      .def_readonly("cost", &LeafCosts::cost)
      .def_readonly("monetary_cost", &LeafCosts::monetary_cost)
      .def_readonly("intensity", &LeafCosts::intensity)
      .def_readonly("available", &LeafCosts::available);

  py::class_<NestEvaluation>(m, "NestEvaluation")
      .def_readonly("region", &NestEvaluation::region)
      .def_readonly("year", &NestEvaluation::year)
      .def_readonly("composite_cost", &NestEvaluation::composite_cost)
      .def_readonly("share", &NestEvaluation::share)
      .def_readonly("absolute_share", &NestEvaluation::absolute_share)
      .def_readonly("intensity", &NestEvaluation::intensity)
      .def_readonly("available", &NestEvaluation::available)
      .def_readonly("excluded", &NestEvaluation::excluded);

  m.def("gather_leaf_costs",
        [](const NestTopology& topo, const PriceTable& prices, const ValueOfTimeTable& vot,
           const std::string& region, Year year, py::object leaf_adjustment, EvaluationOptions opts) {
          py::array adj_arr;
          std::span<const double> adj;
          if (!leaf_adjustment.is_none()) {
            adj_arr = py::cast<py::array>(leaf_adjustment);
            adj = as_span<double>(adj_arr, "leaf_adjustment");
          }
          return gather_leaf_costs(topo, prices, vot, region, year, adj, opts);
        },
        py::arg("topology"), py::arg("prices"), py::arg("value_of_time"), py::arg("region"), py::arg("year"),
        py::kw_only(), py::arg("leaf_adjustment") = py::none(), py::arg("options") = EvaluationOptions{});

  m.def("evaluate_nest",
        [](const NestTopology& topo, const LeafCosts& costs, py::array preference) {
          auto pref = as_span<double>(preference, "preference");
          NestEvaluation ev;
          {
            py::gil_scoped_release release;
            ev = evaluate_nest(topo, costs, pref);
          }
          return ev;
        },
        py::arg("topology"), py::arg("costs"), py::arg("preference"));

  // ---- calibration ----
  py::class_<CalibrationResult>(m, "CalibrationResult")
      .def_readonly("region", &CalibrationResult::region)
      .def_readonly("reference_year", &CalibrationResult::reference_year)
      .def_readonly("mode", &CalibrationResult::mode)
      .def_readonly("preference", &CalibrationResult::preference)
      .def_readonly("composite_cost", &CalibrationResult::composite_cost)
      .def_readonly("observed_share", &CalibrationResult::observed_share)
      .def_readonly("leaf_adjustment", &CalibrationResult::leaf_adjustment);

  m.def("invert_nest",
        [](const NestTopology& topo, const LeafCosts& costs, py::array observed, CalibrationOptions opts) {
          auto obs = as_span<double>(observed, "observed");
          CalibrationResult res;
          {
            py::gil_scoped_release release;
            res = invert_nest(topo, costs, obs, opts);
          }
          return res;
        },
        py::arg("topology"), py::arg("costs"), py::arg("observed"), py::kw_only(),
        py::arg("options") = CalibrationOptions{});

  py::class_<Calibrator, std::shared_ptr<Calibrator>>(m, "Calibrator")
      .def("mode", &Calibrator::mode)
      .def("calibrate",
           [](const Calibrator& c, const NestTopology& topo, const ObservedShareTable& observed,
              const PriceTable& prices, const ValueOfTimeTable& vot, const std::string& region, Year year) {
             py::gil_scoped_release release;
             return c.calibrate(topo, observed, prices, vot, region, year);
           },
           py::arg("topology"), py::arg("observed"), py::arg("prices"), py::arg("value_of_time"),
           py::arg("region"), py::arg("reference_year"));

  m.def("make_calibrator",
        [](CalibrationMode mode, CalibrationOptions opts, std::shared_ptr<CostAdjustmentTable> adjustments) {
          return std::const_pointer_cast<Calibrator>(make_calibrator(mode, opts, std::move(adjustments)));
        },
        py::arg("mode"), py::kw_only(), py::arg("options") = CalibrationOptions{},
        py::arg("adjustments") = nullptr);

  // ---- clustering ----
  py::class_<IndicatorSource, PyIndicatorSource, std::shared_ptr<IndicatorSource>>(m, "IndicatorSource")
      .def(py::init<>())
      .def("indicator", &IndicatorSource::indicator, py::arg("region"));

  m.def("make_table_indicator_source",
        [](std::map<std::string, double> values) {
          return std::const_pointer_cast<IndicatorSource>(make_table_indicator_source(std::move(values)));
        },
        py::arg("values"));

  py::class_<ClusterAssignment>(m, "ClusterAssignment")
      .def_readonly("num_clusters", &ClusterAssignment::num_clusters)
      .def_readonly("cluster_of", &ClusterAssignment::cluster_of)
      .def_readonly("centers", &ClusterAssignment::centers)
      .def("cluster", &ClusterAssignment::cluster, py::arg("region"));

  m.def("assign_clusters",
        [](const std::vector<std::string>& regions, const IndicatorSource& source, ClusteringOptions opts) {
          return assign_clusters(regions, source, opts);
        },
        py::arg("regions"), py::arg("source"), py::kw_only(), py::arg("options") = ClusteringOptions{});

  // ---- preference trends ----
  py::class_<TrendRule>(m, "TrendRule")
      .def(py::init([](std::string node_key, int cluster, double target, Year convergence_year,
                       double rate, ConvergenceLaw law) {
        return TrendRule{std::move(node_key), cluster, target, convergence_year, rate, law};
      }),
        py::arg("node_key"), py::kw_only(), py::arg("cluster") = kAllClusters, py::arg("target") = 1.0,
        py::arg("convergence_year") = 2100, py::arg("rate") = 5.0, py::arg("law") = ConvergenceLaw::Logistic)
      .def_readwrite("node_key", &TrendRule::node_key)
      .def_readwrite("cluster", &TrendRule::cluster)
      .def_readwrite("target", &TrendRule::target)
      .def_readwrite("convergence_year", &TrendRule::convergence_year)
      .def_readwrite("rate", &TrendRule::rate)
      .def_readwrite("law", &TrendRule::law);

  py::class_<InconvenienceRule>(m, "InconvenienceRule")
      .def(py::init([](std::string node_key, int cluster, double final_fraction, Year convergence_year,
                       double rate, ConvergenceLaw law) {
        return InconvenienceRule{std::move(node_key), cluster, final_fraction, convergence_year, rate, law};
      }),
        py::arg("node_key"), py::kw_only(), py::arg("cluster") = kAllClusters, py::arg("final_fraction") = 0.0,
        py::arg("convergence_year") = 2100, py::arg("rate") = 5.0, py::arg("law") = ConvergenceLaw::Exponential)
      .def_readwrite("node_key", &InconvenienceRule::node_key)
      .def_readwrite("cluster", &InconvenienceRule::cluster)
      .def_readwrite("final_fraction", &InconvenienceRule::final_fraction)
      .def_readwrite("convergence_year", &InconvenienceRule::convergence_year)
      .def_readwrite("rate", &InconvenienceRule::rate)
      .def_readwrite("law", &InconvenienceRule::law);

  py::class_<TrendTargets>(m, "TrendTargets")
      .def(py::init<>())
      .def("add_trend", [](TrendTargets& t, TrendRule r) { t.add(std::move(r)); }, py::arg("rule"))
      .def("add_inconvenience", [](TrendTargets& t, InconvenienceRule r) { t.add(std::move(r)); }, py::arg("rule"))
      .def("num_trend_rules", &TrendTargets::num_trend_rules)
      .def("num_inconvenience_rules", &TrendTargets::num_inconvenience_rules);

  m.def("convergence_weight", &convergence_weight,
        py::arg("law"), py::arg("rate"), py::arg("start"), py::arg("end"), py::arg("year"));

  py::class_<RegionTrajectory>(m, "RegionTrajectory")
      .def_readonly("region", &RegionTrajectory::region)
      .def_readonly("cluster", &RegionTrajectory::cluster)
      .def_readonly("years", &RegionTrajectory::years)
      .def_readonly("preference", &RegionTrajectory::preference)
      .def_readonly("leaf_adjustment", &RegionTrajectory::leaf_adjustment)
      .def("preference_at", [](const RegionTrajectory& t, Year y) {
        auto s = t.preference_at(y);
        return std::vector<double>(s.begin(), s.end());
      }, py::arg("year"));

  py::class_<PreferenceTrajectory>(m, "PreferenceTrajectory")
      .def_readonly("regions", &PreferenceTrajectory::regions)
      .def("region", &PreferenceTrajectory::region, py::arg("name"), py::return_value_policy::reference_internal);

  m.def("project_preferences",
        [](const NestTopology& topo, const std::vector<CalibrationResult>& calibrations,
           const ClusterAssignment& clusters, const std::vector<Year>& years,
           const TrendTargets& targets, TrendOptions opts) {
          py::gil_scoped_release release;
          return project_preferences(topo, calibrations, clusters, years, targets, opts);
        },
        py::arg("topology"), py::arg("calibrations"), py::arg("clusters"), py::arg("years"),
        py::arg("targets"), py::kw_only(), py::arg("options") = TrendOptions{});

  // ---- vintage tracking ----
  py::class_<SurvivalSchedule>(m, "SurvivalSchedule")
      .def_static("from_fractions", &SurvivalSchedule::from_fractions, py::arg("fractions"))
      .def_static("linear", &SurvivalSchedule::linear, py::arg("service_life"))
      .def_static("logistic", &SurvivalSchedule::logistic,
                  py::arg("service_life"), py::arg("median_age"), py::arg("steepness"))
      .def("fraction", &SurvivalSchedule::fraction, py::arg("age"))
      .def("max_service_life", &SurvivalSchedule::max_service_life);

  py::class_<SurvivalTable>(m, "SurvivalTable")
      .def(py::init<>())
      .def(py::init<SurvivalSchedule>(), py::arg("default_schedule"))
      .def("set", &SurvivalTable::set, py::arg("technology"), py::arg("schedule"))
      .def("schedule", &SurvivalTable::schedule, py::arg("technology"), py::return_value_policy::copy);

  py::class_<Cohort>(m, "Cohort")
      .def_readonly("leaf", &Cohort::leaf)
      .def_readonly("purchase_year", &Cohort::purchase_year)
      .def_readonly("initial_quantity", &Cohort::initial_quantity)
      .def_readonly("quantity", &Cohort::quantity)
      .def_readonly("price", &Cohort::price)
      .def_readonly("intensity", &Cohort::intensity);

  py::class_<FleetState>(m, "FleetState")
      .def("region", &FleetState::region)
      .def("year", &FleetState::year)
      .def("total_quantity", &FleetState::total_quantity)
      .def("cohorts", [](const FleetState& f) {
        auto s = f.cohorts();
        return std::vector<Cohort>(s.begin(), s.end());
      });

  py::class_<StockSummary>(m, "StockSummary")
      .def_readonly("region", &StockSummary::region)
      .def_readonly("year", &StockSummary::year)
      .def_readonly("quantity", &StockSummary::quantity)
      .def_readonly("stock_share", &StockSummary::stock_share)
      .def_readonly("stock_price", &StockSummary::stock_price)
      .def_readonly("stock_intensity", &StockSummary::stock_intensity)
      .def_readonly("total_quantity", &StockSummary::total_quantity)
      .def_readonly("prior_quantity", &StockSummary::prior_quantity)
      .def_readonly("retirements", &StockSummary::retirements)
      .def_readonly("new_sales", &StockSummary::new_sales)
      .def_readonly("fleet_price", &StockSummary::fleet_price)
      .def_readonly("fleet_intensity", &StockSummary::fleet_intensity);

  py::class_<NewSalesInput>(m, "NewSalesInput")
      .def(py::init([](Year year, double demand, std::vector<double> share, std::vector<double> price,
                       std::vector<double> intensity) {
        return NewSalesInput{year, demand, std::move(share), std::move(price), std::move(intensity)};
      }), py::arg("year"), py::arg("demand"), py::arg("share"), py::arg("price"), py::arg("intensity"))
      .def_readwrite("year", &NewSalesInput::year)
      .def_readwrite("demand", &NewSalesInput::demand)
      .def_readwrite("share", &NewSalesInput::share)
      .def_readwrite("price", &NewSalesInput::price)
      .def_readwrite("intensity", &NewSalesInput::intensity);

  py::class_<FleetStep>(m, "FleetStep")
      .def_readonly("state", &FleetStep::state)
      .def_readonly("summary", &FleetStep::summary);

  py::class_<VintageTracker>(m, "VintageTracker")
      .def(py::init<const NestTopology&, SurvivalTable, VintageOptions>(),
           py::arg("topology"), py::arg("survival") = SurvivalTable{}, py::arg("options") = VintageOptions{},
           py::keep_alive<1, 2>())
      .def("initialize", &VintageTracker::initialize, py::arg("region"), py::arg("base"))
      .def("advance", &VintageTracker::advance, py::arg("prior"), py::arg("input"))
      .def("summarize", &VintageTracker::summarize, py::arg("state"));

  m.def("run_vintage_fold",
        [](const VintageTracker& tracker, const std::string& region, const std::vector<NewSalesInput>& inputs) {
          py::gil_scoped_release release;
          return run_vintage_fold(tracker, region, inputs);
        },
        py::arg("tracker"), py::arg("region"), py::arg("inputs"));

  // ---- pipeline ----
  py::class_<ProjectionInputs>(m, "ProjectionInputs")
      .def(py::init([](std::shared_ptr<NestTopology> topology, std::shared_ptr<PriceTable> prices,
                       std::shared_ptr<ValueOfTimeTable> vot, std::shared_ptr<ObservedShareTable> observed,
                       std::shared_ptr<DemandSeries> demand, std::shared_ptr<IndicatorSource> indicators,
                       std::vector<std::string> regions, std::shared_ptr<CostAdjustmentTable> adjustments,
                       SurvivalTable survival, TrendTargets targets) {
        ProjectionInputs in;
        in.topology = std::move(topology);
        in.prices = std::move(prices);
        in.value_of_time = std::move(vot);
        in.observed = std::move(observed);
        in.demand = std::move(demand);
        in.indicators = std::move(indicators);
        in.regions = std::move(regions);
        in.adjustments = std::move(adjustments);
        in.survival = std::move(survival);
        in.targets = std::move(targets);
        return in;
      }),
        py::arg("topology"), py::arg("prices"), py::arg("value_of_time"), py::arg("observed"),
        py::arg("demand"), py::arg("indicators"), py::arg("regions"), py::kw_only(),
        py::arg("adjustments") = nullptr, py::arg("survival") = SurvivalTable{},
        py::arg("targets") = TrendTargets{});

  py::class_<YearResult>(m, "YearResult")
      .def_readonly("year", &YearResult::year)
      .def_readonly("new_sales", &YearResult::new_sales)
      .def_readonly("stock", &YearResult::stock)
      .def_readonly("fleet", &YearResult::fleet)
      .def_readonly("demand", &YearResult::demand)
      .def_readonly("service", &YearResult::service)
      .def_readonly("energy", &YearResult::energy)
      .def_readonly("energy_by_carrier", &YearResult::energy_by_carrier);

  py::class_<RegionProjection>(m, "RegionProjection")
      .def_readonly("region", &RegionProjection::region)
      .def_readonly("cluster", &RegionProjection::cluster)
      .def_readonly("calibrations", &RegionProjection::calibrations)
      .def_readonly("years", &RegionProjection::years)
      .def_readonly("failure", &RegionProjection::failure)
      .def_readonly("failed_year", &RegionProjection::failed_year);

  py::class_<ProjectionResult>(m, "ProjectionResult")
      .def_readonly("scenario", &ProjectionResult::scenario)
      .def_readonly("clusters", &ProjectionResult::clusters)
      .def_readonly("preferences", &ProjectionResult::preferences)
      .def_readonly("regions", &ProjectionResult::regions);

  m.def("run_projection",
        [](const ScenarioConfig& config, const ProjectionInputs& inputs) {
          py::gil_scoped_release release;
          return run_projection(config, inputs);
        },
        py::arg("config"), py::arg("inputs"));
}

#include "common.hpp"

#include <cxxopts.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>

#include "arma_util.hpp"
#include "convection.hpp"
#include "material.hpp"
#include "phase.hpp"
#include "timer.hpp"

void timed(std::string const & message, std::function<void()> func) {
  std::cout << message << std::flush;
  tic();
  func();
  std::cout << " [" << toc() << "s]" << std::endl;
}

struct layer_spec {
  ice_phase phase;
  layer_thermal_state state;
};

layer_spec layer_from_yaml(YAML::Node const & node) {
  for (auto key: {"phase", "top_temperature", "bottom_temperature",
                  "pressure", "thickness", "gravity"}) {
    if (!node[key]) {
      throw std::runtime_error {
        std::string("layer is missing the \"") + key + "\" entry"};
    }
  }

  layer_spec layer;
  layer.phase = phase_from_string(node["phase"].as<std::string>());
  layer.state.top_temperature = node["top_temperature"].as<double>();
  layer.state.bottom_temperature = node["bottom_temperature"].as<double>();
  layer.state.midpoint_pressure = node["pressure"].as<double>();
  layer.state.thickness = node["thickness"].as<double>();
  layer.state.gravity = node["gravity"].as<double>();
  return layer;
}

struct job_params {
  static job_params from_yaml(std::string const & path_str) {
    job_params params;

    YAML::Node config = YAML::LoadFile(path_str.c_str());

    if (config["task"]) {
      params.task = config["task"].as<std::string>();
    }

    if (config["phase"]) {
      params.phase = config["phase"].as<std::string>();
    }

    if (config["top_temperature"]) {
      params.top_temperature = config["top_temperature"].as<double>();
    }

    if (config["bottom_temperature"]) {
      params.bottom_temperature = config["bottom_temperature"].as<double>();
    }

    if (config["pressure"]) {
      params.pressure = config["pressure"].as<double>();
    }

    if (config["thickness"]) {
      params.thickness = config["thickness"].as<double>();
    }

    if (config["gravity"]) {
      params.gravity = config["gravity"].as<double>();
    }

    if (config["mode"]) {
      params.mode = config["mode"].as<std::string>();
    }

    if (config["thickness_range"]) {
      params.thickness_range =
        config["thickness_range"].as<std::vector<double>>();
    }

    if (config["bottom_temperature_range"]) {
      params.bottom_temperature_range =
        config["bottom_temperature_range"].as<std::vector<double>>();
    }

    if (config["nsweep"]) {
      params.nsweep = config["nsweep"].as<int>();
    }

    if (config["output_dir"]) {
      params.output_dir = config["output_dir"].as<std::string>();
    }

    if (config["quiet"]) {
      params.quiet = config["quiet"].as<bool>();
    }

    if (config["print_config"]) {
      params.print_config = config["print_config"].as<bool>();
    }

    if (config["layers"]) {
      std::vector<layer_spec> layers;
      for (auto const & node: config["layers"]) {
        layers.push_back(layer_from_yaml(node));
      }
      params.layers = layers;
    }

    return params;
  }

  opt_t<std::string> task;
  opt_t<std::string> phase;
  opt_t<std::string> mode;

  opt_t<double> top_temperature;
  opt_t<double> bottom_temperature;
  opt_t<double> pressure;
  opt_t<double> thickness;
  opt_t<double> gravity;

  opt_t<std::vector<double>> thickness_range;
  opt_t<std::vector<double>> bottom_temperature_range;
  opt_t<int> nsweep;

  opt_t<std::string> output_dir;

  opt_t<bool> quiet;
  opt_t<bool> print_config;

  opt_t<std::vector<layer_spec>> layers;

  layer_spec get_layer() const {
    layer_spec layer;
    layer.phase = phase_from_string(*phase);
    layer.state.top_temperature = *top_temperature;
    layer.state.bottom_temperature = *bottom_temperature;
    layer.state.midpoint_pressure = *pressure;
    layer.state.thickness = *thickness;
    layer.state.gravity = *gravity;
    return layer;
  }

  void display() const {
    using std::cout;
    using std::endl;
    auto const show = [] (opt_t<double> const & x) {
      return x ? std::to_string(*x) : std::string {"N/A"};
    };
    cout << "task: " << *task << endl
         << "phase: " << (phase ? *phase : "N/A") << endl
         << "mode: " << *mode << endl
         << "top_temperature: " << show(top_temperature) << endl
         << "bottom_temperature: " << show(bottom_temperature) << endl
         << "pressure: " << show(pressure) << endl
         << "thickness: " << show(thickness) << endl
         << "gravity: " << show(gravity) << endl
         << "nsweep: " << *nsweep << endl
         << "output_dir: " << (output_dir ? *output_dir : "N/A") << endl
         << "quiet: " << *quiet << endl
         << "layers: "
         << (layers ? std::to_string(layers->size()) : std::string {"N/A"})
         << endl;
  }
};

void warn_if_clathrate_unstable(layer_spec const & layer) {
  auto const & s = layer.state;
  if (layer.phase == ice_phase::clathrate &&
      !clathrate_stable(s.midpoint_pressure, s.bottom_temperature)) {
    std::cerr << "- warning: clathrate isn't stable at "
              << s.midpoint_pressure << " MPa and " << s.bottom_temperature
              << " K" << std::endl;
  }
}

void display_result(regime_result const & result) {
  using std::cout;
  using std::endl;
  cout << "regime: " << to_string(result.regime) << endl
       << "convecting: " << result.convecting << endl
       << "heat_flux: " << result.heat_flux << " W/m^2" << endl
       << "upper_tbl: " << result.upper_tbl << " m" << endl
       << "lower_tbl: " << result.lower_tbl << " m" << endl
       << "core_temperature: " << result.core_temperature << " K" << endl
       << "viscosity: " << result.viscosity << " Pa s" << endl
       << "density: " << result.props.density << " kg/m^3" << endl
       << "thermal_expansion: " << result.props.thermal_expansion << " 1/K"
       << endl
       << "specific_heat: " << result.props.specific_heat << " J/kg/K" << endl
       << "thermal_conductivity: " << result.props.thermal_conductivity
       << " W/m/K" << endl
       << "rayleigh: " << result.rayleigh << endl
       << "critical_rayleigh: " << result.critical_rayleigh << endl;
}

void do_layer_task(job_params const & params,
                   material_provider const & provider)
{
  auto layer = params.get_layer();
  warn_if_clathrate_unstable(layer);

  auto mode = convection_mode_from_string(*params.mode);

  regime_result result;
  timed("- evaluating " + to_string(layer.phase) + " layer", [&] () {
    result = evaluate_convection(layer.state, layer.phase, provider, mode);
  });

  display_result(result);

  boost::filesystem::path output_dir_path = params.output_dir ?
    *params.output_dir : ".";

  if (!*params.quiet) {
    timed("- saving result", [&] () {
      arma_util::save_mat(
        arma_util::results_to_mat({result}),
        arma_util::result_columns(),
        output_dir_path/"layer");
    });
  }
}

void do_layers_task(job_params const & params,
                    material_provider const & provider)
{
  auto mode = convection_mode_from_string(*params.mode);

  auto const & layers = *params.layers;
  int nlayers = layers.size();

  arma::mat results(nlayers, arma_util::result_columns().size());
  results.fill(arma::datum::nan);

  int nfailed = 0;
  for (int i = 0; i < nlayers; ++i) {
    auto const & layer = layers[i];
    std::string frame_str =
      std::to_string(i + 1) + "/" + std::to_string(nlayers);

    warn_if_clathrate_unstable(layer);

    // A failed layer is reported and skipped; its row stays NaN
    try {
      timed("- " + frame_str + ": evaluating " + to_string(layer.phase), [&] () {
        auto result = evaluate_convection(
          layer.state, layer.phase, provider, mode);
        results.row(i) = arma_util::result_to_row(result);
        std::cout << " [" << to_string(result.regime) << ", Q = "
                  << result.heat_flux << " W/m^2]";
      });
    } catch (std::exception const & e) {
      std::cout << std::endl;
      std::cerr << "- " << frame_str << ": error: " << e.what() << std::endl;
      ++nfailed;
    }
  }

  if (nfailed > 0) {
    std::cerr << "- " << nfailed << " of " << nlayers
              << " layers failed" << std::endl;
  }

  boost::filesystem::path output_dir_path = params.output_dir ?
    *params.output_dir : ".";

  if (!*params.quiet) {
    timed("- saving layer results", [&] () {
      arma_util::save_mat(
        results, arma_util::result_columns(), output_dir_path/"layers");
    });
  }
}

void do_sweep_task(job_params const & params,
                   material_provider const & provider)
{
  auto layer = params.get_layer();
  auto mode = convection_mode_from_string(*params.mode);

  auto const & h_range = *params.thickness_range;
  auto const & Tm_range = *params.bottom_temperature_range;

  arma::vec h = arma::linspace(h_range[0], h_range[1], *params.nsweep);
  arma::vec Tm = arma::linspace(Tm_range[0], Tm_range[1], *params.nsweep);

  std::vector<std::string> columns = {"thickness", "bottom_temperature"};
  for (auto const & column: arma_util::result_columns()) {
    columns.push_back(column);
  }

  arma::mat sweep(h.n_elem*Tm.n_elem, columns.size());
  sweep.fill(arma::datum::nan);

  int nfailed = 0;
  timed("- sweeping " + std::to_string(sweep.n_rows) + " layers", [&] () {
    arma::uword row = 0;
    for (arma::uword i = 0; i < h.n_elem; ++i) {
      for (arma::uword j = 0; j < Tm.n_elem; ++j, ++row) {
        auto state = layer.state;
        state.thickness = h(i);
        state.bottom_temperature = Tm(j);
        sweep(row, 0) = h(i);
        sweep(row, 1) = Tm(j);
        try {
          auto result = evaluate_convection(state, layer.phase, provider, mode);
          sweep.submat(row, 2, row, sweep.n_cols - 1) =
            arma_util::result_to_row(result);
        } catch (std::exception const &) {
          ++nfailed;
        }
      }
    }
  });

  if (nfailed > 0) {
    std::cerr << "- " << nfailed << " of " << sweep.n_rows
              << " layers failed and were left as NaN" << std::endl;
  }

  boost::filesystem::path output_dir_path = params.output_dir ?
    *params.output_dir : ".";

  if (!*params.quiet) {
    timed("- saving regime map", [&] () {
      arma_util::save_mat(sweep, columns, output_dir_path/"sweep");
    });
  }
}

int main(int argc, char * argv[]) {
  std::set<std::string> tasks = {
    "layer",
    "layers",
    "sweep"
  };

  auto tasks_to_string = [&] () {
    std::string s;
    for (auto task: tasks) s += "  " + task + '\n';
    return s;
  };

  cxxopts::Options options(
    boost::filesystem::path {std::string(argv[0])}.filename().c_str(),
    ("Available tasks:\n\n" + tasks_to_string()).c_str());

  options.add_options()
    (
      "h,help",
      "Display usage"
    )
    (
      "version",
      "Display version"
    )
    (
      "task",
      "Task to do",
      cxxopts::value<std::string>()->default_value("layer")
    )
    (
      "config",
      "Path to YAML configuration file",
      cxxopts::value<std::string>()
    )
    (
      "phase",
      "Phase of the layer (Ih, II, III, V, VI or clathrate)",
      cxxopts::value<std::string>()
    )
    (
      "top_temperature",
      "Temperature at the top of the layer [K]",
      cxxopts::value<double>()
    )
    (
      "bottom_temperature",
      "Temperature at the bottom of the layer [K]",
      cxxopts::value<double>()
    )
    (
      "pressure",
      "Pressure at the middle of the layer [MPa]",
      cxxopts::value<double>()
    )
    (
      "thickness",
      "Layer thickness [m]",
      cxxopts::value<double>()
    )
    (
      "gravity",
      "Gravitational acceleration [m/s^2]",
      cxxopts::value<double>()->default_value("1.315")
    )
    (
      "mode",
      "Convection mode (check, force or suppress)",
      cxxopts::value<std::string>()->default_value("check")
    )
    (
      "thickness_range",
      "Smallest and largest thickness for the `sweep' task [m]",
      cxxopts::value<std::vector<double>>()
    )
    (
      "bottom_temperature_range",
      "Smallest and largest bottom temperature for the `sweep' task [K]",
      cxxopts::value<std::vector<double>>()
    )
    (
      "nsweep",
      "Number of values in each sweep range",
      cxxopts::value<int>()->default_value("50")
    )
    (
      "output_dir",
      "Output directory",
      cxxopts::value<std::string>()
    )
    (
      "quiet",
      "Don't save output",
      cxxopts::value<bool>()->default_value("false")
    )
    (
      "print_config",
      "Print configuration before running",
      cxxopts::value<bool>()->default_value("false")
    )
    ;

  auto args = [&] () {
    try {
      return options.parse(argc, argv);
    } catch (std::exception const & e) {
      std::cerr << "error: " << e.what() << std::endl;
      std::exit(EXIT_FAILURE);
    }
  }();
  if (args.count("help")) {
    std::cout << options.help() << std::endl;
    std::exit(EXIT_SUCCESS);
  }

  if (args.count("version")) {
    std::cout << SHELLCONV_VERSION << std::endl;
    std::exit(EXIT_SUCCESS);
  }

  job_params params;

  /**
   * If a path to a configuration file is passed, we initialize params
   * from this file. Any other options that are passed overwrite these
   * parameters.
   */
  if (args.count("config") != 0) {
    try {
      params = job_params::from_yaml(args["config"].as<std::string>());
    } catch (std::exception const & e) {
      std::cerr << "error: failed to load configuration: " << e.what()
                << std::endl;
      std::exit(EXIT_FAILURE);
    }
  }

  auto const show_help_and_die = [&] () {
    std::cout << options.help() << std::endl;
    std::exit(EXIT_FAILURE);
  };

  if (!params.task || args.count("task")) {
    params.task = args["task"].as<std::string>();
  }

  if (tasks.find(*params.task) == tasks.end()) {
    show_help_and_die();
  }

  if (args.count("phase")) {
    params.phase = args["phase"].as<std::string>();
  }

  if (args.count("top_temperature")) {
    params.top_temperature = args["top_temperature"].as<double>();
  }

  if (args.count("bottom_temperature")) {
    params.bottom_temperature = args["bottom_temperature"].as<double>();
  }

  if (args.count("pressure")) {
    params.pressure = args["pressure"].as<double>();
  }

  if (args.count("thickness")) {
    params.thickness = args["thickness"].as<double>();
  }

  if (!params.gravity || args.count("gravity")) {
    params.gravity = args["gravity"].as<double>();
  }

  if (!params.mode || args.count("mode")) {
    params.mode = args["mode"].as<std::string>();
  }

  if (args.count("thickness_range")) {
    params.thickness_range =
      args["thickness_range"].as<std::vector<double>>();
  }

  if (args.count("bottom_temperature_range")) {
    params.bottom_temperature_range =
      args["bottom_temperature_range"].as<std::vector<double>>();
  }

  if (!params.nsweep || args.count("nsweep")) {
    params.nsweep = args["nsweep"].as<int>();
  }

  if (args.count("output_dir")) {
    params.output_dir = args["output_dir"].as<std::string>();
  }

  if (!params.quiet || args.count("quiet")) {
    params.quiet = args["quiet"].as<bool>();
  }

  if (!params.print_config || args.count("print_config")) {
    params.print_config = args["print_config"].as<bool>();
  }

  /**
   * Error and consistency checking
   */
  if (*params.task == "layer" || *params.task == "sweep") {
    if (!params.phase || !params.top_temperature || !params.pressure) {
      std::cerr << "Provide the layer with --phase, --top_temperature "
                << "and --pressure" << std::endl;
      show_help_and_die();
    }
  }

  if (*params.task == "layer") {
    if (!params.bottom_temperature || !params.thickness) {
      std::cerr << "Provide the layer with --bottom_temperature and "
                << "--thickness" << std::endl;
      show_help_and_die();
    }
  }

  if (*params.task == "sweep") {
    if (!params.thickness_range || params.thickness_range->size() != 2 ||
        !params.bottom_temperature_range ||
        params.bottom_temperature_range->size() != 2) {
      std::cerr << "When sweeping provide two values each for "
                << "--thickness_range and --bottom_temperature_range"
                << std::endl;
      std::exit(EXIT_FAILURE);
    }
    if (*params.nsweep < 1) {
      std::cerr << "--nsweep must be positive" << std::endl;
      std::exit(EXIT_FAILURE);
    }
    // Placeholders; every sweep point overwrites them
    params.bottom_temperature = params.bottom_temperature_range->back();
    params.thickness = params.thickness_range->back();
  }

  if (*params.task == "layers" && !params.layers) {
    std::cerr << "The `layers' task needs a `layers' list in the YAML "
              << "configuration file" << std::endl;
    std::exit(EXIT_FAILURE);
  }

  if (params.output_dir &&
      !boost::filesystem::is_directory(*params.output_dir)) {
    std::cerr << "- output directory " << *params.output_dir
              << " doesn't exist" << std::endl;
    std::exit(EXIT_FAILURE);
  }

  if (*params.print_config) {
    params.display();
  }

  ice_eos_provider provider;

  try {
    if (*params.task == "layer") {
      do_layer_task(params, provider);
    } else if (*params.task == "layers") {
      do_layers_task(params, provider);
    } else if (*params.task == "sweep") {
      do_sweep_task(params, provider);
    }
  } catch (std::exception const & e) {
    std::cout << std::endl;
    std::cerr << "error: " << e.what() << std::endl;
    std::exit(EXIT_FAILURE);
  }
}

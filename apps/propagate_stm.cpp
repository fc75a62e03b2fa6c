#include <common/stm.hpp>
#include <dynamics/force_composer.hpp>
#include <dynamics/variational_dynamics.hpp>
#include <integrator/rk4.hpp>
#include <io/scenario.hpp>
#include <propagator/numerical_propagator.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("input,i", po::value<std::string>()->required(), "Input JSON scenario (epoch, initial state, duration, force model)")
        ("output,o", po::value<std::string>()->default_value("trajectory.json"), "Output JSON file with propagated states and STMs")
        ("timestep,t", po::value<double>(), "Override the scenario timestep (seconds)")
        ("no-stm", "Propagate the 6-element state only");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    io::Scenario scenario;
    try {
        scenario = io::load_scenario(vm["input"].as<std::string>());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (vm.count("timestep")) {
        scenario.timestep = vm["timestep"].as<double>();
    }
    if (vm.count("no-stm")) {
        scenario.with_stm = false;
    }

    nlohmann::json output;
    try {
        auto env = io::build_environment(scenario);
        auto composer = dynamics::ForceComposer::from_config(scenario.forces, env, std::cerr);
        auto dynamics = std::make_shared<dynamics::VariationalDynamics>(composer, scenario.epoch);
        auto integrator = std::make_shared<integrator::RK4Integrator>();
        propagator::NumericalPropagator propagator(dynamics, integrator, scenario.timestep);

        propagator::Trajectory trajectory = scenario.with_stm
            ? propagator.propagate_with_stm(0.0, scenario.initial_state, scenario.duration)
            : propagator.propagate(0.0, scenario.initial_state, scenario.duration);

        const auto& diagnostics = dynamics->diagnostics();
        output = io::trajectory_to_json(trajectory, scenario, *composer, diagnostics);

        const auto& [tf, final_state] = trajectory.back();
        std::cout << std::fixed << std::setprecision(3)
                  << "Propagated " << trajectory.size() << " points to t = " << tf << " s" << std::endl
                  << "Final position (m): " << final_state.head<3>().transpose() << std::endl
                  << "Final velocity (m/s): " << final_state.segment<3>(3).transpose() << std::endl;
        if (scenario.with_stm) {
            std::cout << std::setprecision(6) << "Final STM:" << std::endl
                      << common::stm_of(final_state) << std::endl;
        }
        if (!diagnostics.clean()) {
            std::cout << "Skipped " << diagnostics.skipped_terms << " optional force terms (last: "
                      << diagnostics.last_failure_reason << ")" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: propagation failed: " << e.what() << std::endl;
        return 1;
    }

    try {
        io::write_json(vm["output"].as<std::string>(), output);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Trajectory data written to " << vm["output"].as<std::string>() << std::endl;
    return 0;
}

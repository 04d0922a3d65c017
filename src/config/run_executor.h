#pragma once
#include "config/run_config.h"
#include "simulation/simulation.h"
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace dts {

struct RunReport {
    std::size_t sections_run     = 0;
    std::size_t sections_skipped = 0;
    std::vector<std::string> created_ids;
    std::vector<std::string> exported_paths;
};

// Dispatches the sections of a run file, in file order, onto a Simulation.
class RunExecutor {
public:
    // PrintVehicleInfo output goes to `out`.
    explicit RunExecutor(std::ostream& out = std::cout);

    // Load the trace named by [Simulation] trace_path and apply every other
    // section to it. Throws SimError(MALFORMED_INPUT) without [Simulation].
    std::unique_ptr<Simulation> run(const RunConfig& cfg);

    // Apply every section except [Simulation] to an existing simulation.
    // The first failing section aborts the run by rethrowing.
    void apply(const RunConfig& cfg, Simulation& sim);

    const RunReport& report() const { return report_; }

private:
    // Returns false when the section name matches no known group.
    bool dispatch(const ConfigSection& s, Simulation& sim);

    std::ostream& out_;
    RunReport report_;
};

} // namespace dts

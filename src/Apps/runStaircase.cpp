#include "Staircase.hpp"
#include "ProcedureIO.hpp"
#include "ResponseSource.hpp"
#include <memory>
#include <sstream>

static std::string join(const std::vector<double>& values) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < values.size(); ++i)
        ss << (i ? ", " : "") << values[i];
    return ss.str();
}

int main(int argc, char *argv[])
{
    Options options("runStaircase.exe","Adaptive Staircase Threshold Run");
    options.add_options()
        ("c,config","Staircase parameters JSON: -c params.json",value<std::string>())
        ("t,threshold","Simulate responses for a subject with this threshold: -t 30",value<double>())
        ("o,output","Prefix for the state JSON and data CSV: -o data/subject_1",value<std::string>())
        ("v,verbose","Verbose logging: -v")
        ("h,help","print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") > 0) {
        print("{}",options.help());
        return 0;
    }
    if (result.count("v"))
        MahiLogger->set_max_severity(Verbose);

    // reduce step size every two reversals
    Staircase::Params params;
    params.start_val   = 50;
    params.n_reversals = 10;
    params.step_sizes  = { 8, 4, 4, 2, 2, 1 };
    params.n_trials    = 15;
    params.n_up        = 1;
    params.n_down      = 1;
    params.step_type   = Staircase::Lin;
    params.min_val     = 0;
    params.max_val     = 60;
    if (result.count("c") && !importParams(result["c"].as<std::string>(), params)) {
        LOG(Error) << "Could not read Staircase parameters. Exiting code.";
        return 1;
    }

    std::unique_ptr<Staircase> stairs;
    try {
        stairs = std::make_unique<Staircase>(params);
    }
    catch (const std::invalid_argument& e) {
        LOG(Error) << "Invalid Staircase parameters: " << e.what() << ". Exiting code.";
        return 1;
    }

    std::unique_ptr<ResponseSource> responder;
    if (result.count("t"))
        responder = std::make_unique<SimulatedResponder>(*stairs, result["t"].as<double>());
    else
        responder = std::make_unique<ConsoleResponder>();

    print("{}", stairs->toString());
    while (auto intensity = stairs->advance()) {
        auto response = responder->getResponse(*intensity);
        if (!response) {
            LOG(Warning) << "No more responses, stopping at trial " << stairs->thisTrialN();
            break;
        }
        print("trial # {}: intensity {}, response {}", stairs->thisTrialN(), *intensity, *response);
        if (!stairs->addResponse(*response))
            break;
    }

    print("reversals: [{}]", join(stairs->reversalIntensities()));
    if (auto thresh = stairs->threshold())
        print("mean of final 6 reversals: {}", *thresh);
    if (const auto& pf = stairs->psychometricFunction()) {
        for (std::size_t i = 0; i < pf->intensities.size(); ++i)
            print("intensity {:>10}: hit rate {:.2f} ({} trials)", pf->intensities[i], pf->percent_correct[i], pf->responses_per_intensity[i]);
    }

    if (result.count("o")) {
        std::string prefix = result["o"].as<std::string>();
        bool ok = exportState(*stairs, prefix + "_staircase.json");
        ok = exportCsv(*stairs, prefix + "_staircase.csv") && ok;
        if (!ok)
            return 1;
    }
    return 0;
}

#include "TrialSequence.hpp"
#include "ProcedureIO.hpp"
#include "Util/Random.hpp"
#include <memory>
#include <sstream>

int main(int argc, char *argv[])
{
    Options options("runSequence.exe","Randomized Trial Sequence Builder");
    options.add_options()
        ("n,conditions","Number of conditions: -n 5",value<int>())
        ("r,reps","Repetitions of every condition: -r 2",value<int>())
        ("m,mmn","Build an oddball sequence with this many trials: -m 100",value<int>())
        ("f,freq","Deviant frequency of the oddball sequence, max 0.25: -f 0.12",value<double>())
        ("s,seed","Random seed, e.g. the subject number: -s 3",value<unsigned int>())
        ("o,output","Export the sequence state to JSON: -o sequence.json",value<std::string>())
        ("v,verbose","Verbose logging: -v")
        ("h,help","print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") > 0) {
        print("{}",options.help());
        return 0;
    }
    if (result.count("v"))
        MahiLogger->set_max_severity(Verbose);
    if (result.count("s"))
        seedShuffleEngine(result["s"].as<unsigned int>());

    std::unique_ptr<TrialSequence> seq;
    try {
        if (result.count("m") && !result.count("n")) {
            double freq = result.count("f") ? result["f"].as<double>() : 0.12;
            seq = std::make_unique<TrialSequence>(TrialSequence::mmnSequence(result["m"].as<int>(), freq));
        }
        else if (result.count("n") && !result.count("m")) {
            int reps = result.count("r") ? result["r"].as<int>() : 1;
            seq = std::make_unique<TrialSequence>(result["n"].as<int>(), reps);
        }
        else {
            LOG(Error) << "Give either a number of conditions or an oddball trial count. Exiting code.";
            print("{}",options.help());
            return 1;
        }
    }
    catch (const std::invalid_argument& e) {
        LOG(Error) << "Invalid sequence settings: " << e.what() << ". Exiting code.";
        return 1;
    }

    std::ostringstream trials;
    while (auto trial = seq->advance())
        trials << trial->dump() << " ";
    print("{}", trials.str());

    print("transitions:");
    for (const auto& row : seq->transitions()) {
        std::ostringstream ss;
        for (int count : row)
            ss << count << " ";
        print("  {}", ss.str());
    }
    std::ostringstream probs;
    for (double p : seq->conditionProbabilities())
        probs << p << " ";
    print("condition probabilities: {}", probs.str());

    if (result.count("o") && !exportState(*seq, result["o"].as<std::string>()))
        return 1;
    return 0;
}

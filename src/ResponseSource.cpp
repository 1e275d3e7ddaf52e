#include "ResponseSource.hpp"

std::optional<bool> SimulatedResponder::getResponse(double) {
    return m_stairs.simulateResponse(m_thresh);
}

std::optional<bool> ConsoleResponder::getResponse(double intensity) {
    std::string line;
    while (true) {
        m_out << "Intensity " << intensity << ", detected? [y/n]: " << std::flush;
        if (!std::getline(m_in, line))
            return std::nullopt;
        if (!line.empty() && line.back() == '\r') // CRLF answer files
            line.pop_back();
        if (line == "y" || line == "Y" || line == "1")
            return true;
        if (line == "n" || line == "N" || line == "0")
            return false;
        LOG(Warning) << "Unrecognized response '" << line << "', answer y or n.";
    }
}

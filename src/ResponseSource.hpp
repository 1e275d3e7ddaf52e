#pragma once
#include <iostream>
#include <optional>
#include <string>
#include "Staircase.hpp"

/// Where subject responses come from. The procedures never read input themselves.
class ResponseSource {
public:
    virtual ~ResponseSource() = default;
    /// Response to a trial presented at intensity, nothing if no response is available anymore
    virtual std::optional<bool> getResponse(double intensity) = 0;
};

/// Answers with Staircase::simulateResponse, for demos and tests
class SimulatedResponder : public ResponseSource {
public:
    SimulatedResponder(const Staircase& stairs, double thresh) : m_stairs(stairs), m_thresh(thresh) { }
    std::optional<bool> getResponse(double intensity) override;
private:
    const Staircase& m_stairs;
    double           m_thresh;
};

/// Reads y/n answers line by line from a stream
class ConsoleResponder : public ResponseSource {
public:
    ConsoleResponder(std::istream& in = std::cin, std::ostream& out = std::cout) : m_in(in), m_out(out) { }
    std::optional<bool> getResponse(double intensity) override;
private:
    std::istream& m_in;
    std::ostream& m_out;
};

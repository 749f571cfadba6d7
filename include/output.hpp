#pragma once

#include "engine.hpp"
#include <string>

namespace credscan {

class Printer {
public:
    virtual ~Printer() = default;
    virtual void print(const ResultWithMetadata& r) = 0;
};

// Human-readable block per result on stdout.
class PlainPrinter final : public Printer {
public:
    void print(const ResultWithMetadata& r) override;
    static std::string format(const ResultWithMetadata& r);
};

// One JSON object per line on stdout.
class JsonPrinter final : public Printer {
public:
    void print(const ResultWithMetadata& r) override;
    static std::string format(const ResultWithMetadata& r);
};

} // namespace credscan

#pragma once

#include "output/sink.hpp"

#include <string>
#include <string_view>

namespace bridgegrader {

class StdoutSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;
};

/// Collects everything written to it; used where output has to be inspected
class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }
    void flush() override {}

    const std::string& str() const { return buffer_; }

    ~StringSink() override = default;

private:
    std::string buffer_;
};

} // namespace bridgegrader

#pragma once
#include "io/io.hpp"
#include <cstdint>

namespace zipline {

class CountingWriter final : public IWriter {
public:
    explicit CountingWriter(IWriter& inner) : inner_(inner) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        auto r = inner_.WriteAll(in);
        if (r.is_ok()) written_ += in.size();
        return r;
    }

    Result Flush() override { return inner_.Flush(); }

    std::uint64_t BytesWritten() const { return written_; }

private:
    IWriter& inner_;
    std::uint64_t written_ = 0;
};

} // namespace zipline

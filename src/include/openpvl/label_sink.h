#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file label_sink.h
 * \brief Append-only byte sinks receiving encoder output.
 */

namespace openpvl {

/**
 * \brief Destination for encoded label bytes.
 *
 * The encoder only appends. It never flushes, retries or retracts bytes;
 * buffering and backpressure belong to the sink.
 */
class LabelSink {
public:
    virtual ~LabelSink()                       = default;
    virtual void write(std::string_view bytes) = 0;
};

/// Appends to a caller-owned string.
class StringLabelSink final : public LabelSink {
public:
    explicit StringLabelSink(std::string* out) noexcept;
    void write(std::string_view bytes) override;

private:
    std::string* out_ = nullptr;
};

/// Appends to a caller-owned byte vector.
class ByteVectorLabelSink final : public LabelSink {
public:
    explicit ByteVectorLabelSink(std::vector<std::byte>* out) noexcept;
    void write(std::string_view bytes) override;

private:
    std::vector<std::byte>* out_ = nullptr;
};

/// Appends to a caller-owned `FILE*`. The stream is not closed or flushed.
class FileLabelSink final : public LabelSink {
public:
    explicit FileLabelSink(std::FILE* file) noexcept;
    void write(std::string_view bytes) override;

    /// True once any `fwrite` wrote fewer bytes than requested.
    bool failed() const noexcept;

private:
    std::FILE* file_ = nullptr;
    bool failed_     = false;
};

/// Discards bytes, keeping only their count.
class CountingLabelSink final : public LabelSink {
public:
    void write(std::string_view bytes) override;
    uint64_t count() const noexcept;

private:
    uint64_t count_ = 0;
};

}  // namespace openpvl

#include "openpvl/label_sink.h"

#include <cstring>

namespace openpvl {

StringLabelSink::StringLabelSink(std::string* out) noexcept
    : out_(out)
{
}


void
StringLabelSink::write(std::string_view bytes)
{
    if (!out_) {
        return;
    }
    out_->append(bytes.data(), bytes.size());
}


ByteVectorLabelSink::ByteVectorLabelSink(std::vector<std::byte>* out) noexcept
    : out_(out)
{
}


void
ByteVectorLabelSink::write(std::string_view bytes)
{
    if (!out_ || bytes.empty()) {
        return;
    }
    const size_t offset = out_->size();
    out_->resize(offset + bytes.size());
    std::memcpy(out_->data() + offset, bytes.data(), bytes.size());
}


FileLabelSink::FileLabelSink(std::FILE* file) noexcept
    : file_(file)
{
}


void
FileLabelSink::write(std::string_view bytes)
{
    if (bytes.empty()) {
        return;
    }
    if (!file_) {
        failed_ = true;
        return;
    }
    const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), file_);
    if (n != bytes.size()) {
        failed_ = true;
    }
}


bool
FileLabelSink::failed() const noexcept
{
    return failed_;
}


void
CountingLabelSink::write(std::string_view bytes)
{
    count_ += static_cast<uint64_t>(bytes.size());
}


uint64_t
CountingLabelSink::count() const noexcept
{
    return count_;
}

}  // namespace openpvl

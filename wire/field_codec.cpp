#include "field_codec.H"

#include "common/errors.H"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace tws::wire {

FieldWriter& FieldWriter::add_string(const std::string& value) {
    buf.append(value);
    buf.push_back('\0');
    return *this;
}

FieldWriter& FieldWriter::add_int(int64_t value) {
    return add_string(std::to_string(value));
}

FieldWriter& FieldWriter::add_double(double value) {
    return add_string(fmt::format("{}", value));
}

FieldWriter& FieldWriter::add_optional(const std::optional<double>& value) {
    if (!value) {
        return add_string("");
    }
    return add_double(*value);
}

FieldWriter& FieldWriter::add_bool(bool value) {
    return add_string(value ? "1" : "0");
}

std::string FieldWriter::frame() const {
    return make_frame(buf);
}

std::string make_frame(const std::string& payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(4 + payload.size());
    frame.push_back(static_cast<char>((len >> 24) & 0xFF));
    frame.push_back(static_cast<char>((len >> 16) & 0xFF));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
    frame.append(payload);
    return frame;
}

FieldReader::FieldReader(const std::vector<std::string>& fields, size_t pos)
    : fields(fields), pos(pos) {}

const std::string& FieldReader::next(const char* what) {
    if (pos >= fields.size()) {
        throw protocol_error(fmt::format("frame truncated: expected {} at field {}", what, pos));
    }
    return fields[pos++];
}

const std::string& FieldReader::read_string() {
    return next("string");
}

int FieldReader::read_int() {
    return static_cast<int>(read_int64());
}

int64_t FieldReader::read_int64() {
    const std::string& field = next("integer");
    if (field.empty()) {
        return 0;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(field.c_str(), &end, 10);
    if (errno != 0 || end == field.c_str() || *end != '\0') {
        throw protocol_error(fmt::format("invalid integer '{}' at field {}", field, pos - 1));
    }
    return value;
}

double FieldReader::read_double() {
    const std::string& field = next("decimal");
    if (field.empty()) {
        return 0.0;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(field.c_str(), &end);
    if (errno == ERANGE || end == field.c_str() || *end != '\0') {
        throw protocol_error(fmt::format("invalid decimal '{}' at field {}", field, pos - 1));
    }
    return value;
}

std::optional<double> FieldReader::read_optional_double() {
    if (pos < fields.size() && fields[pos].empty()) {
        pos++;
        return std::nullopt;
    }
    double value = read_double();
    if (value >= std::numeric_limits<double>::max()) {
        return std::nullopt;
    }
    return value;
}

bool FieldReader::read_bool() {
    return read_int64() != 0;
}

void FieldReader::skip(size_t count) {
    for (size_t i = 0; i < count; i++) {
        next("field");
    }
}

} // namespace tws::wire

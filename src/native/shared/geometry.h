// geometry.h - Position, size, monitor and icon values
// Public value model shared by the dispatcher, the runtime and every toolkit backend.
// Logical values are in device-independent units, physical values in screen pixels.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_GEOMETRY_H
#define WEBSHELL_GEOMETRY_H

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace webshell {

template<typename T>
struct PhysicalPosition {
    T x = 0;
    T y = 0;

    PhysicalPosition() = default;
    PhysicalPosition(T x, T y) : x(x), y(y) {}

    bool operator==(const PhysicalPosition& other) const { return x == other.x && y == other.y; }
    bool operator!=(const PhysicalPosition& other) const { return !(*this == other); }
};

template<typename T>
struct LogicalPosition {
    T x = 0;
    T y = 0;

    LogicalPosition() = default;
    LogicalPosition(T x, T y) : x(x), y(y) {}

    bool operator==(const LogicalPosition& other) const { return x == other.x && y == other.y; }
    bool operator!=(const LogicalPosition& other) const { return !(*this == other); }
};

template<typename T>
struct PhysicalSize {
    T width = 0;
    T height = 0;

    PhysicalSize() = default;
    PhysicalSize(T width, T height) : width(width), height(height) {}

    bool operator==(const PhysicalSize& other) const { return width == other.width && height == other.height; }
    bool operator!=(const PhysicalSize& other) const { return !(*this == other); }
};

template<typename T>
struct LogicalSize {
    T width = 0;
    T height = 0;

    LogicalSize() = default;
    LogicalSize(T width, T height) : width(width), height(height) {}

    bool operator==(const LogicalSize& other) const { return width == other.width && height == other.height; }
    bool operator!=(const LogicalSize& other) const { return !(*this == other); }
};

// Scale conversions round to the nearest pixel and saturate at the target type's range;
// NaN becomes 0 and a scale factor that is not positive converts as 1.0
template<typename T>
T saturatingRound(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    double rounded = std::round(value);
    if (rounded <= static_cast<double>(std::numeric_limits<T>::min())) {
        return std::numeric_limits<T>::min();
    }
    if (rounded >= static_cast<double>(std::numeric_limits<T>::max())) {
        return std::numeric_limits<T>::max();
    }
    return static_cast<T>(rounded);
}

inline PhysicalSize<uint32_t> toPhysical(const LogicalSize<double>& size, double scaleFactor) {
    if (!(scaleFactor > 0)) scaleFactor = 1.0;
    return PhysicalSize<uint32_t>(saturatingRound<uint32_t>(size.width * scaleFactor),
                                  saturatingRound<uint32_t>(size.height * scaleFactor));
}

inline LogicalSize<double> toLogical(const PhysicalSize<uint32_t>& size, double scaleFactor) {
    if (!(scaleFactor > 0)) scaleFactor = 1.0;
    return LogicalSize<double>(size.width / scaleFactor, size.height / scaleFactor);
}

inline PhysicalPosition<int32_t> toPhysical(const LogicalPosition<double>& position, double scaleFactor) {
    if (!(scaleFactor > 0)) scaleFactor = 1.0;
    return PhysicalPosition<int32_t>(saturatingRound<int32_t>(position.x * scaleFactor),
                                     saturatingRound<int32_t>(position.y * scaleFactor));
}

inline LogicalPosition<double> toLogical(const PhysicalPosition<int32_t>& position, double scaleFactor) {
    if (!(scaleFactor > 0)) scaleFactor = 1.0;
    return LogicalPosition<double>(position.x / scaleFactor, position.y / scaleFactor);
}

// A size given either in logical or in physical units
class Size {
public:
    enum class Kind { LOGICAL, PHYSICAL };

    static Size logical(double width, double height) {
        Size size(Kind::LOGICAL);
        size.logical_ = LogicalSize<double>(width, height);
        return size;
    }

    static Size physical(uint32_t width, uint32_t height) {
        Size size(Kind::PHYSICAL);
        size.physical_ = PhysicalSize<uint32_t>(width, height);
        return size;
    }

    Kind kind() const { return kind_; }

    PhysicalSize<uint32_t> toPhysical(double scaleFactor) const {
        return kind_ == Kind::PHYSICAL ? physical_ : webshell::toPhysical(logical_, scaleFactor);
    }

    LogicalSize<double> toLogical(double scaleFactor) const {
        return kind_ == Kind::LOGICAL ? logical_ : webshell::toLogical(physical_, scaleFactor);
    }

private:
    explicit Size(Kind kind) : kind_(kind) {}

    Kind kind_;
    LogicalSize<double> logical_;
    PhysicalSize<uint32_t> physical_;
};

// A position given either in logical or in physical units
class Position {
public:
    enum class Kind { LOGICAL, PHYSICAL };

    static Position logical(double x, double y) {
        Position position(Kind::LOGICAL);
        position.logical_ = LogicalPosition<double>(x, y);
        return position;
    }

    static Position physical(int32_t x, int32_t y) {
        Position position(Kind::PHYSICAL);
        position.physical_ = PhysicalPosition<int32_t>(x, y);
        return position;
    }

    Kind kind() const { return kind_; }

    PhysicalPosition<int32_t> toPhysical(double scaleFactor) const {
        return kind_ == Kind::PHYSICAL ? physical_ : webshell::toPhysical(logical_, scaleFactor);
    }

    LogicalPosition<double> toLogical(double scaleFactor) const {
        return kind_ == Kind::LOGICAL ? logical_ : webshell::toLogical(physical_, scaleFactor);
    }

private:
    explicit Position(Kind kind) : kind_(kind) {}

    Kind kind_;
    LogicalPosition<double> logical_;
    PhysicalPosition<int32_t> physical_;
};

struct Monitor {
    std::optional<std::string> name;
    PhysicalPosition<int32_t> position;
    PhysicalSize<uint32_t> size;
    double scaleFactor = 1.0;
};

// Icon as supplied by the application: a path on disk or encoded image bytes
struct Icon {
    enum class Source { FILE, RAW };

    Source source = Source::RAW;
    std::string path;
    std::vector<uint8_t> bytes;

    static Icon fromFile(const std::string& path) {
        Icon icon;
        icon.source = Source::FILE;
        icon.path = path;
        return icon;
    }

    static Icon fromBytes(std::vector<uint8_t> bytes) {
        Icon icon;
        icon.source = Source::RAW;
        icon.bytes = std::move(bytes);
        return icon;
    }
};

// Decoded icon in the toolkit's format: tightly packed RGBA rows
struct WindowIcon {
    std::vector<uint8_t> rgba;
    uint32_t width = 0;
    uint32_t height = 0;
};

} // namespace webshell

#endif // WEBSHELL_GEOMETRY_H

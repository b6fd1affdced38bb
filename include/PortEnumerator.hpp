#pragma once
#include <string>
#include <vector>

namespace UrSerial {

// Lists tty device nodes known to udev, keeping those matching a path prefix filter
class PortEnumerator {
public:
    explicit PortEnumerator(std::vector<std::string> devicePathFilters);

    // Sorted by device path. Throws std::runtime_error when udev cannot be queried.
    std::vector<std::string> enumerate() const;

    bool matchesFilter(const std::string& devicePath) const;

    static std::vector<std::string> defaultFilters();

private:
    std::vector<std::string> devicePathFilters_;
};

} // namespace UrSerial

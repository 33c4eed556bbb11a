#ifndef SYSFS_GPIO_HPP
#define SYSFS_GPIO_HPP

#include <matrix_lines.hpp>
#include <log.hpp>
#include <string>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace linux {

/**
 * @brief One GPIO exposed through the legacy sysfs interface (/sys/class/gpio)
 *
 * Exports the pin on construction if the kernel has not exported it yet.
 * The pin is left exported on destruction so other tools can inspect it.
 */
class SysfsGpio {
public:
    /**
     * @param gpio Kernel GPIO number
     * @param basePath sysfs GPIO root, overridable for testing against a fake tree
     * @throws std::runtime_error if the pin cannot be exported
     */
    explicit SysfsGpio(unsigned int gpio, const std::string& basePath = "/sys/class/gpio")
        : gpio_(gpio)
        , pinPath_(basePath + "/gpio" + std::to_string(gpio)) {

        struct stat info;
        if (stat(pinPath_.c_str(), &info) == 0) {
            return;  // Already exported
        }

        int error = writeFile(basePath + "/export", std::to_string(gpio));
        if (error != 0) {
            throw std::runtime_error("Cannot export GPIO " + std::to_string(gpio) + ": " + std::strerror(error));
        }
        logDebug("Exported GPIO %u", gpio_);
    }

    /**
     * @brief Write the direction attribute ("in", "out", "low" or "high")
     * @return true on success
     */
    bool setDirection(const char* direction) {
        int error = writeFile(pinPath_ + "/direction", direction);
        if (error != 0) {
            logError("GPIO %u: cannot set direction %s: %s", gpio_, direction, std::strerror(error));
            return false;
        }
        return true;
    }

    /**
     * @brief Read the value attribute
     * @param level Receives 0 or 1
     * @return true on success
     */
    bool readValue(int& level) const {
        int fd = ::open((pinPath_ + "/value").c_str(), O_RDONLY);
        if (fd < 0) {
            logError("GPIO %u: cannot open value: %s", gpio_, std::strerror(errno));
            return false;
        }
        char c = 0;
        ssize_t n = ::read(fd, &c, 1);
        int error = errno;
        ::close(fd);
        if (n != 1) {
            logError("GPIO %u: cannot read value: %s", gpio_, n < 0 ? std::strerror(error) : "empty file");
            return false;
        }
        level = (c == '0') ? 0 : 1;
        return true;
    }

    unsigned int number() const { return gpio_; }

private:
    // sysfs attributes take the whole value in one write. Returns 0 or the errno of the failure.
    static int writeFile(const std::string& path, const std::string& text) {
        int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC);
        if (fd < 0) {
            return errno;
        }
        ssize_t n = ::write(fd, text.data(), text.size());
        int error = (n < 0) ? errno : (static_cast<size_t>(n) != text.size() ? EIO : 0);
        if (::close(fd) != 0 && error == 0) {
            error = errno;
        }
        return error;
    }

    unsigned int gpio_;
    std::string pinPath_;
};

/**
 * @brief Keypad row backed by a sysfs GPIO input
 *
 * The pull-up must come from the board configuration (device tree overlay or
 * external resistor); sysfs cannot enable it.
 */
class SysfsGpioRowLine : public keypad::RowLine {
public:
    explicit SysfsGpioRowLine(unsigned int gpio, const std::string& basePath = "/sys/class/gpio")
        : gpio_(gpio, basePath) {
        if (!gpio_.setDirection("in")) {
            throw std::runtime_error("Cannot configure GPIO " + std::to_string(gpio) + " as row input");
        }
    }

    bool isAsserted() const override {
        int level = 1;
        // An unreadable line counts as released so a pass never fails halfway
        if (!gpio_.readValue(level)) {
            return false;
        }
        return level == 0;
    }

private:
    SysfsGpio gpio_;
};

/**
 * @brief Keypad column backed by a sysfs GPIO, emulating open-drain
 *
 * Driving low switches the pin to output with an initial low level in one
 * write ("low"); releasing switches it back to input so it floats.
 *
 * A failed release is retried once. If the pin still cannot be switched back
 * it may stay low, so release() reports false and the failure is counted for
 * the application to act on.
 */
class SysfsGpioColumnLine : public keypad::ColumnLine {
public:
    explicit SysfsGpioColumnLine(unsigned int gpio, const std::string& basePath = "/sys/class/gpio")
        : gpio_(gpio, basePath) {
        if (!gpio_.setDirection("in")) {
            throw std::runtime_error("Cannot configure GPIO " + std::to_string(gpio) + " as column");
        }
    }

    void driveLow() override {
        if (!gpio_.setDirection("low")) {
            failureCount_++;
        }
    }

    bool release() override {
        if (gpio_.setDirection("in") || gpio_.setDirection("in")) {
            return true;
        }
        failureCount_++;
        return false;
    }

    /**
     * @brief Number of failed drives and releases (after retry) since construction
     */
    unsigned int failureCount() const { return failureCount_; }

    unsigned int gpio() const { return gpio_.number(); }

private:
    SysfsGpio gpio_;
    unsigned int failureCount_ = 0;
};

} // namespace linux

#endif // SYSFS_GPIO_HPP

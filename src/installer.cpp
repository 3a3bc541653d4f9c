#include "installer.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

// -----------------------------------------------------------------------
// File I/O
// -----------------------------------------------------------------------

void save_config_file(const ConfigBlob& blob, const std::string& path) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
        throw std::runtime_error("Cannot open '" + path + "' for writing: " +
                                 std::strerror(errno));
    f.write(reinterpret_cast<const char*>(blob.data()),
            static_cast<std::streamsize>(blob.size()));
    f.close();
    if (!f)
        throw std::runtime_error("Error writing '" + path + "'");
}

std::vector<uint8_t> read_config_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw std::runtime_error("Cannot open '" + path + "': " +
                                 std::strerror(errno));
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
    if (f.bad())
        throw std::runtime_error("Error reading '" + path + "'");
    return data;
}

// -----------------------------------------------------------------------
// System checks
// -----------------------------------------------------------------------

std::string find_program(const std::string& name) {
    std::string search;
    if (const char* p = std::getenv("PATH")) search = p;
    search += ":/sbin:/usr/sbin";

    std::istringstream ss(search);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return "";
}

// Run a program with arguments and wait for it. Returns its exit status.
// With `quiet` set, the child's stdout and stderr go to /dev/null.
static int run_program(const std::string& prog, const std::vector<std::string>& args,
                       bool quiet = false) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(prog.c_str()));
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        if (quiet) {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                ::close(devnull);
            }
        }
        ::execv(prog.c_str(), argv.data());
        _exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

SystemCheck check_system_requirements(const std::string& firmware_dir,
                                      const std::string& module) {
    std::error_code ec;
    if (!fs::is_directory(firmware_dir, ec))
        return {false, "Directory " + firmware_dir + " does not exist"};

    std::string modprobe = find_program("modprobe");
    if (modprobe.empty())
        return {false, "modprobe command not found"};

    // Dry run: resolves the module without loading it.
    if (run_program(modprobe, {"-n", module}, true) != 0)
        return {false, "Goodix driver module not available"};

    return {true, "System requirements met"};
}

// -----------------------------------------------------------------------
// Install
// -----------------------------------------------------------------------

std::string install_config(const ConfigBlob& blob, const std::string& firmware_dir) {
    std::error_code ec;
    if (!fs::is_directory(firmware_dir, ec))
        throw std::runtime_error("Firmware directory " + firmware_dir + " does not exist");

    std::string target = (fs::path(firmware_dir) / GT911_FIRMWARE_NAME).string();
    save_config_file(blob, target);

    fs::permissions(target,
                    fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec)
        throw std::runtime_error("Cannot set permissions on " + target + ": " +
                                 ec.message());
    return target;
}

// -----------------------------------------------------------------------
// Driver reload
// -----------------------------------------------------------------------

void reload_driver() {
    std::string modprobe = find_program("modprobe");
    if (modprobe.empty())
        throw std::runtime_error("modprobe command not found");

    int r = run_program(modprobe, {"-r", GT911_DRIVER_MODULE});
    if (r != 0)
        throw std::runtime_error("Error unloading driver (modprobe -r exited with " +
                                 std::to_string(r) + ")");

    // Give the kernel time to release the device.
    std::this_thread::sleep_for(std::chrono::seconds(1));

    r = run_program(modprobe, {GT911_DRIVER_MODULE});
    if (r != 0)
        throw std::runtime_error("Error loading driver (modprobe exited with " +
                                 std::to_string(r) + ")");
}

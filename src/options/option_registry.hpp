#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lrunbox::options {

enum class Cardinality {
    kSingle,
    kMulti,
    kUnknown
};

// Every option lrun understands: X(name, Accessor, cardinality).
// Single options keep the last value written, multi options accumulate and
// are emitted once per value.
#define LRUNBOX_OPTION_LIST(X)                  \
    X(max_cpu_time, MaxCpuTime, kSingle)        \
    X(max_real_time, MaxRealTime, kSingle)      \
    X(max_memory, MaxMemory, kSingle)           \
    X(max_output, MaxOutput, kSingle)           \
    X(max_nprocess, MaxNprocess, kSingle)       \
    X(max_rtprio, MaxRtprio, kSingle)           \
    X(max_nfile, MaxNfile, kSingle)             \
    X(max_stack, MaxStack, kSingle)             \
    X(isolate_process, IsolateProcess, kSingle) \
    X(basic_devices, BasicDevices, kSingle)     \
    X(reset_env, ResetEnv, kSingle)             \
    X(network, Network, kSingle)                \
    X(chroot, Chroot, kSingle)                  \
    X(chdir, Chdir, kSingle)                    \
    X(nice, Nice, kSingle)                      \
    X(umask, Umask, kSingle)                    \
    X(uid, Uid, kSingle)                        \
    X(gid, Gid, kSingle)                        \
    X(interval, Interval, kSingle)              \
    X(cgname, Cgname, kSingle)                  \
    X(bindfs, Bindfs, kMulti)                   \
    X(cgroup_option, CgroupOption, kMulti)      \
    X(tmpfs, Tmpfs, kMulti)                     \
    X(env, Env, kMulti)                         \
    X(fd, Fd, kMulti)                           \
    X(group, Group, kMulti)                     \
    X(cmd, Cmd, kMulti)

struct OptionInfo {
    const char* name;
    Cardinality cardinality;
};

const OptionInfo* RegisteredOptions();
std::size_t RegisteredOptionCount();

// kUnknown for names lrun does not know. Unknown keys still survive a merge
// (stdin, stdout, stderr and truncate live there) but never become flags.
Cardinality GetCardinality(std::string_view name);
bool IsRegistered(std::string_view name);

// "max_cpu_time" -> "--max-cpu-time"
std::string FlagName(std::string_view name);

const char* ToString(Cardinality cardinality);

}  // namespace lrunbox::options

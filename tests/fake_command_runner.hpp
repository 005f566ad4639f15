/**
 * @file fake_command_runner.hpp
 * @brief Scripted docker CLI stand-in for unit tests
 *
 * Interprets the docker subcommands issued by ContainerClient and keeps an
 * in-memory view of the images and containers that would exist on a real
 * daemon, so tests can assert that nothing outlives a run.
 */

#pragma once

#include "repoprobe/utils/command_runner.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace repoprobe {
namespace test {

class FakeCommandRunner : public utils::ICommandRunner {
public:
    struct Behavior {
        bool daemon_available{true};
        bool build_succeeds{true};
        bool build_times_out{false};
        std::string build_output{"Step 1/7 : FROM node:20-slim\nSuccessfully built abc123\n"};
        bool run_succeeds{true};
        bool run_leaves_container{false};     ///< Failed run still creates the container
        bool inspect_fails{false};
        bool logs_fail{false};
        bool rmi_fails{false};

        std::string status{"running"};
        bool running{true};
        int exit_code{0};
        std::vector<int> exposed_ports{3000, 8080};
        std::string logs;
    };

    Behavior behavior;

    std::vector<std::vector<std::string>> calls;
    std::vector<utils::CommandOptions> call_options;
    std::set<std::string> images;
    std::map<std::string, std::string> containers;   ///< id -> name
    std::vector<std::string> last_run_args;
    int inspect_count{0};

    utils::CommandResult Run(const std::vector<std::string>& argv,
                             const utils::CommandOptions& options) override {
        calls.push_back(argv);
        call_options.push_back(options);

        if (argv.size() < 2) {
            return Fail(1, "usage");
        }

        const std::string& cmd = argv[1];
        if (cmd == "version") return Version();
        if (cmd == "build") return Build(argv);
        if (cmd == "run") return RunContainer(argv);
        if (cmd == "inspect") return Inspect(argv.back());
        if (cmd == "logs") return Logs();
        if (cmd == "stop") return Stop(argv.back());
        if (cmd == "rm") return Remove(argv.back());
        if (cmd == "rmi") return RemoveImage(argv.back());
        if (cmd == "images") return ListImages(argv.back());
        if (cmd == "ps") return ListContainers();
        return Fail(1, "unknown command " + cmd);
    }

    /// Number of recorded invocations of a docker subcommand
    int CountCalls(const std::string& subcommand) const {
        return static_cast<int>(std::count_if(calls.begin(), calls.end(),
            [&](const std::vector<std::string>& argv) {
                return argv.size() > 1 && argv[1] == subcommand;
            }));
    }

    bool AnyArgument(const std::string& value) const {
        for (const auto& argv : calls) {
            if (std::find(argv.begin(), argv.end(), value) != argv.end()) {
                return true;
            }
        }
        return false;
    }

private:
    int next_container_{1};

    static utils::CommandResult Ok(const std::string& out) {
        utils::CommandResult r;
        r.exit_code = 0;
        r.success = true;
        r.stdout_output = out;
        return r;
    }

    static utils::CommandResult Fail(int code, const std::string& err) {
        utils::CommandResult r;
        r.exit_code = code;
        r.success = false;
        r.stderr_output = err;
        return r;
    }

    static std::string ArgAfter(const std::vector<std::string>& argv, const std::string& flag) {
        auto it = std::find(argv.begin(), argv.end(), flag);
        return (it != argv.end() && it + 1 != argv.end()) ? *(it + 1) : std::string();
    }

    utils::CommandResult Version() {
        if (!behavior.daemon_available) {
            return Fail(1, "Cannot connect to the Docker daemon at unix:///var/run/docker.sock\n");
        }
        return Ok("24.0.7\n");
    }

    utils::CommandResult Build(const std::vector<std::string>& argv) {
        const auto tag = ArgAfter(argv, "-t");
        if (behavior.build_times_out) {
            utils::CommandResult r;
            r.exit_code = -1;
            r.timed_out = true;
            r.stdout_output = behavior.build_output;
            return r;
        }
        if (!behavior.build_succeeds) {
            utils::CommandResult r = Fail(1, "");
            r.stdout_output = behavior.build_output;
            return r;
        }
        images.insert(tag);
        return Ok(behavior.build_output);
    }

    utils::CommandResult RunContainer(const std::vector<std::string>& argv) {
        last_run_args = argv;
        const auto name = ArgAfter(argv, "--name");
        if (!behavior.run_succeeds) {
            if (behavior.run_leaves_container) {
                containers["deadbeef" + std::to_string(next_container_++)] = name;
            }
            return Fail(125, "docker: Error response from daemon: driver failed programming external connectivity\n");
        }
        const std::string id = "c0ffee" + std::to_string(next_container_++) + "0000000000000000";
        containers[id] = name;
        return Ok(id + "\n");
    }

    utils::CommandResult Inspect(const std::string& ref) {
        ++inspect_count;
        if (behavior.inspect_fails || FindContainer(ref) == containers.end()) {
            return Fail(1, "Error: No such object: " + ref + "\n");
        }

        nlohmann::json ports = nlohmann::json::object();
        int host_port = 49153;
        for (int port : behavior.exposed_ports) {
            ports[std::to_string(port) + "/tcp"] = nlohmann::json::array({
                {{"HostIp", "0.0.0.0"}, {"HostPort", std::to_string(host_port++)}}});
        }

        nlohmann::json doc = nlohmann::json::array({{
            {"Id", FindContainer(ref)->first},
            {"Name", "/" + FindContainer(ref)->second},
            {"State", {
                {"Status", behavior.status},
                {"Running", behavior.running},
                {"ExitCode", behavior.exit_code}
            }},
            {"NetworkSettings", {{"Ports", ports}}}
        }});
        return Ok(doc.dump());
    }

    utils::CommandResult Logs() {
        if (behavior.logs_fail) {
            return Fail(1, "Error: logs unavailable\n");
        }
        return Ok(behavior.logs);
    }

    utils::CommandResult Stop(const std::string& ref) {
        if (FindContainer(ref) == containers.end()) {
            return Fail(1, "Error: No such container: " + ref + "\n");
        }
        return Ok(ref + "\n");
    }

    utils::CommandResult Remove(const std::string& ref) {
        auto it = FindContainer(ref);
        if (it == containers.end()) {
            return Fail(1, "Error: No such container: " + ref + "\n");
        }
        containers.erase(it);
        return Ok(ref + "\n");
    }

    utils::CommandResult RemoveImage(const std::string& tag) {
        if (behavior.rmi_fails) {
            return Fail(1, "Error: conflict: unable to remove repository reference\n");
        }
        if (images.erase(tag) == 0) {
            return Fail(1, "Error: No such image: " + tag + "\n");
        }
        return Ok("Untagged: " + tag + "\n");
    }

    utils::CommandResult ListImages(const std::string& filter) {
        const std::string prefix = "reference=";
        const auto tag = filter.substr(filter.find(prefix) == 0 ? prefix.size() : 0);
        return Ok(images.count(tag) ? "sha256:1234abcd\n" : "");
    }

    utils::CommandResult ListContainers() {
        std::string out;
        for (const auto& entry : containers) {
            out += entry.first + "\n";
        }
        return Ok(out);
    }

    std::map<std::string, std::string>::iterator FindContainer(const std::string& ref) {
        for (auto it = containers.begin(); it != containers.end(); ++it) {
            if (it->first == ref || it->second == ref) {
                return it;
            }
        }
        return containers.end();
    }
};

} // namespace test
} // namespace repoprobe

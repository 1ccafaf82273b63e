#include "PortScanner.hpp"
#include "../common/IpUtils.hpp"
#include "../common/ScanErrors.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace net_discovery::scanners
{
    namespace
    {
        std::vector<std::string> Tokenize(const std::string &text)
        {
            std::vector<std::string> tokens;
            std::istringstream ss(text);
            std::string token;
            while (ss >> token)
                tokens.push_back(token);
            return tokens;
        }

        std::string Join(const std::vector<std::string> &parts, const std::string &sep)
        {
            std::string out;
            for (std::size_t i = 0; i < parts.size(); ++i)
            {
                if (i)
                    out += sep;
                out += parts[i];
            }
            return out;
        }

        std::vector<std::string> Split(const std::string &text, char sep)
        {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream ss(text);
            while (std::getline(ss, part, sep))
                parts.push_back(part);
            if (!text.empty() && text.back() == sep)
                parts.push_back("");
            return parts;
        }

        bool StartsWith(const std::string &text, const std::string &prefix)
        {
            return text.compare(0, prefix.size(), prefix) == 0;
        }

        bool IsNumber(const std::string &text)
        {
            return !text.empty() && std::all_of(text.begin(), text.end(), [](char c)
                                                { return std::isdigit(static_cast<unsigned char>(c)); });
        }

        bool IsPrivilegedFlag(const std::string &flag)
        {
            return flag == "-sS" || flag == "-sU" || flag == "-O";
        }

        // "22/open/tcp//ssh//OpenSSH 8.9p1/, 80/open/tcp//http///"
        void ParsePorts(const std::string &field, common::DeviceRecord &record)
        {
            std::vector<std::string> entries;
            std::size_t start = 0;
            while (start < field.size())
            {
                std::size_t sep = field.find(", ", start);
                std::string piece = field.substr(start, sep == std::string::npos ? std::string::npos : sep - start);

                // Version strings may contain ", "; glue those back onto the previous entry.
                if (!entries.empty() && !IsNumber(piece.substr(0, piece.find('/'))))
                    entries.back() += ", " + piece;
                else
                    entries.push_back(piece);

                if (sep == std::string::npos)
                    break;
                start = sep + 2;
            }

            // tcp entries first: when tcp and udp share a port number the tcp service is kept.
            std::vector<std::vector<std::string>> open_entries;
            for (const auto &entry : entries)
            {
                std::vector<std::string> parts = Split(entry, '/');
                if (parts.size() < 5 || !IsNumber(parts[0]) || parts[0].size() > 5 || parts[1] != "open")
                    continue;
                open_entries.push_back(std::move(parts));
            }
            std::stable_partition(open_entries.begin(), open_entries.end(),
                                  [](const std::vector<std::string> &parts)
                                  { return parts[2] != "udp"; });

            for (const auto &parts : open_entries)
            {
                int port = std::stoi(parts[0]);
                if (port <= 0 || port > 65535)
                    continue;

                record.open_ports.insert(port);

                std::string service = parts[4].empty() ? "unknown" : parts[4];
                if (parts[2] == "udp")
                    service += "/udp";
                if (parts.size() > 6 && !parts[6].empty())
                    service += " (" + parts[6] + ")";
                record.services.emplace(port, service);
            }
        }
    }

    PortScanner::PortScanner(std::shared_ptr<ProcessExecutor> executor, std::function<bool()> is_root)
        : m_executor(std::move(executor)), m_is_root(std::move(is_root)) {}

    std::vector<std::string> PortScanner::BuildCommand(const common::PortScanConfig &config,
                                                       const std::string &executable,
                                                       const std::vector<std::string> &targets)
    {
        std::vector<std::string> argv = {executable};

        for (const auto &field : {config.scan_type, config.port_range, config.timing})
        {
            for (auto &token : Tokenize(field))
                argv.push_back(std::move(token));
        }
        if (config.os_detection)
            argv.push_back("-O");
        if (config.service_detection)
            argv.push_back("-sV");
        for (const auto &flag : config.additional_flags)
        {
            for (auto &token : Tokenize(flag))
                argv.push_back(std::move(token));
        }

        argv.push_back("-oG");
        argv.push_back("-");
        argv.push_back("--max-hostgroup");
        argv.push_back(std::to_string(std::max(1, config.workers)));

        argv.insert(argv.end(), targets.begin(), targets.end());
        return argv;
    }

    bool PortScanner::NeedsPrivilege(const common::PortScanConfig &config)
    {
        if (config.os_detection)
            return true;
        for (const auto &field : {config.scan_type, Join(config.additional_flags, " ")})
        {
            for (const auto &token : Tokenize(field))
            {
                if (IsPrivilegedFlag(token))
                    return true;
            }
        }
        return false;
    }

    common::PortScanConfig PortScanner::Unprivileged(const common::PortScanConfig &config)
    {
        auto downgrade = [](const std::string &field)
        {
            std::vector<std::string> kept;
            for (const auto &token : Tokenize(field))
            {
                if (token == "-sS")
                    kept.push_back("-sT");
                else if (token != "-sU" && token != "-O")
                    kept.push_back(token);
            }
            return Join(kept, " ");
        };

        common::PortScanConfig out = config;
        out.os_detection = false;
        out.scan_type = downgrade(config.scan_type);
        out.additional_flags.clear();
        for (const auto &flag : config.additional_flags)
        {
            std::string kept = downgrade(flag);
            if (!kept.empty())
                out.additional_flags.push_back(kept);
        }
        return out;
    }

    std::vector<common::DeviceRecord> PortScanner::ParseGrepableOutput(const std::string &text)
    {
        common::DeviceMap hosts;
        std::istringstream stream(text);
        std::string line;

        while (std::getline(stream, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (!StartsWith(line, "Host: "))
                continue;

            std::vector<std::string> fields = Split(line, '\t');

            // "Host: 192.168.1.1 (router.lan)"
            std::string head = fields[0].substr(6);
            std::string ip = head.substr(0, head.find(' '));
            if (!common::IsValidIpv4(ip))
                continue;

            std::string hostname;
            auto open = head.find('(');
            auto close = head.rfind(')');
            if (open != std::string::npos && close != std::string::npos && close > open + 1)
                hostname = head.substr(open + 1, close - open - 1);

            bool down = false;
            for (std::size_t i = 1; i < fields.size(); ++i)
            {
                if (StartsWith(fields[i], "Status: ") && fields[i].substr(8) != "Up")
                    down = true;
            }
            if (down)
                continue;

            common::DeviceRecord &record = hosts[ip];
            record.ip_address = ip;
            if (!hostname.empty() && !record.hostname)
                record.hostname = hostname;

            for (std::size_t i = 1; i < fields.size(); ++i)
            {
                const std::string &field = fields[i];
                if (StartsWith(field, "Ports: "))
                    ParsePorts(field.substr(7), record);
                else if (StartsWith(field, "OS: ") && field.size() > 4 && !record.os_info)
                    record.os_info = field.substr(4);
            }
        }

        std::vector<common::DeviceRecord> out;
        out.reserve(hosts.size());
        for (auto &pair : hosts)
            out.push_back(std::move(pair.second));
        return out;
    }

    std::vector<std::string> PortScanner::SnmpCandidates(const common::PhaseResult &result)
    {
        std::vector<std::string> candidates;
        for (const auto &record : result.observations)
        {
            if (record.open_ports.count(common::SNMP_PORT))
                candidates.push_back(record.ip_address);
        }
        return common::SortByAddress(std::move(candidates));
    }

    common::PhaseResult PortScanner::Scan(const std::vector<std::string> &targets,
                                          const common::DiscoveryConfig &config,
                                          core::ScanContext &context)
    {
        common::PhaseResult result;
        result.phase = common::PhaseId::PortScan;
        result.status = common::ScanStatus::InProgress;
        result.targets_given = targets.size();

        auto &log = context.Log();
        auto finish = [&](common::ScanStatus status)
        {
            result.status = status;
            result.log = log.Lines();
            result.elapsed = context.Elapsed();
            return result;
        };

        if (targets.empty())
        {
            log.Info("No targets, nothing to scan");
            return finish(common::ScanStatus::Completed);
        }

        common::PortScanConfig effective = config.portscan;
        if (NeedsPrivilege(effective) && !m_is_root())
        {
            common::PermissionError error("-sS, -sU and -O need root");
            core::ErrorContext error_context;
            error_context.phase = common::PhaseId::PortScan;
            error_context.fallback_available = true;

            if (context.Errors().Handle(error, error_context) == core::RecoveryAction::Fallback)
            {
                effective = Unprivileged(effective);
                log.Warn("Not root, downgrading scan to '" + effective.scan_type + "' without OS detection");
            }
        }

        std::vector<std::string> executables = {effective.executable};
        if (!effective.fallback_executable.empty() && effective.fallback_executable != effective.executable)
            executables.push_back(effective.fallback_executable);

        ProcessResult run;
        for (std::size_t i = 0; i < executables.size(); ++i)
        {
            std::vector<std::string> argv = BuildCommand(effective, executables[i], targets);
            log.Info("Running " + executables[i] + " against " + std::to_string(targets.size()) + " targets");

            run = m_executor->Execute(argv, context.Bounded(std::chrono::seconds(effective.timeout_seconds)),
                                      context.Cancel().get());
            if (run.launched)
            {
                result.strategy_used = executables[i];
                break;
            }

            common::ToolError error("cannot run " + executables[i] + ": " + run.launch_error);
            core::ErrorContext error_context;
            error_context.phase = common::PhaseId::PortScan;
            error_context.fallback_available = i + 1 < executables.size();

            result.errors.push_back({error.Category(), std::nullopt, error.what()});
            if (context.Errors().Handle(error, error_context) != core::RecoveryAction::Fallback)
            {
                log.Error(error.what());
                return finish(common::ScanStatus::Failed);
            }
        }

        result.observations = ParseGrepableOutput(run.stdout_text);
        const std::size_t parsed = result.observations.size();

        auto tool_failure = [&](const std::string &message)
        {
            common::ToolError error(message);
            core::ErrorContext error_context;
            error_context.phase = common::PhaseId::PortScan;
            context.Errors().Handle(error, error_context);
            result.errors.push_back({error.Category(), std::nullopt, message});
            log.Error(message);
        };

        if (run.cancelled)
        {
            log.Warn("Cancelled, keeping " + std::to_string(parsed) + " hosts parsed so far");
            return finish(common::ScanStatus::Partial);
        }

        if (run.timed_out)
        {
            tool_failure("timeout: " + result.strategy_used + " did not finish within " +
                         std::to_string(effective.timeout_seconds) + "s (" + std::to_string(parsed) +
                         " hosts parsed)");
            return finish(parsed > 0 ? common::ScanStatus::Partial : common::ScanStatus::Failed);
        }

        if (run.exit_code != 0)
        {
            std::string detail = run.stderr_text.substr(0, run.stderr_text.find('\n'));
            tool_failure(result.strategy_used + " exited with " + std::to_string(run.exit_code) +
                         (detail.empty() ? "" : ": " + detail));
            return finish(parsed > 0 ? common::ScanStatus::Partial : common::ScanStatus::Failed);
        }

        log.Info(std::to_string(parsed) + " hosts up, " + std::to_string(SnmpCandidates(result).size()) +
                 " with SNMP port open");
        return finish(common::ScanStatus::Completed);
    }
}

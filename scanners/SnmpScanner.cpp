#include "SnmpScanner.hpp"
#include "../common/IpUtils.hpp"
#include "../common/ScanErrors.hpp"
#include "../common/VendorCatalog.hpp"
#include "../core/WorkerPool.hpp"

#include <algorithm>
#include <mutex>

namespace net_discovery::scanners
{
    namespace
    {
        enum class Outcome
        {
            Answered,
            Silent,
            Stopped,
            Abandoned
        };

        bool HasValue(const SnmpReply &reply)
        {
            return reply.error_status == common::snmp::ERROR_NONE && !reply.varbind.IsException() &&
                   reply.varbind.type != common::snmp::ValueType::Null;
        }

        // Request/retry bookkeeping for one device.
        class DeviceSession
        {
        public:
            DeviceSession(SnmpTransport &transport, const std::string &ip, const common::SnmpConfig &config,
                          core::ScanContext &context)
                : m_transport(transport), m_ip(ip), m_config(config), m_context(context) {}

            Outcome Exchange(bool next, const common::SnmpCredential &credential, const std::string &oid,
                             SnmpReply &out)
            {
                const std::chrono::milliseconds timeout = std::chrono::seconds(m_config.timeout_seconds);

                while (true)
                {
                    if (m_context.ShouldStop())
                        return Outcome::Stopped;

                    try
                    {
                        auto bounded = m_context.Bounded(timeout);
                        auto reply = next ? m_transport.GetNext(m_ip, credential, oid, bounded)
                                          : m_transport.Get(m_ip, credential, oid, bounded);
                        if (!reply)
                            return Outcome::Silent;
                        out = std::move(*reply);
                        return Outcome::Answered;
                    }
                    catch (const common::ScanError &e)
                    {
                        core::ErrorContext error_context;
                        error_context.phase = common::PhaseId::Snmp;
                        error_context.target = m_ip;
                        error_context.attempt = m_failures;
                        error_context.max_retries = m_config.retries;

                        if (m_context.Errors().Handle(e, error_context) == core::RecoveryAction::Retry)
                        {
                            ++m_failures;
                            continue;
                        }

                        m_error = common::PhaseError{e.Category(), m_ip, e.what()};
                        return Outcome::Abandoned;
                    }
                }
            }

            // false when the device was abandoned or the phase is stopping.
            bool Walk(const common::SnmpCredential &credential, const std::string &root, common::SnmpData &data)
            {
                std::string current = root;
                std::size_t collected = 0;

                while (collected < m_config.max_walk_oids)
                {
                    SnmpReply reply;
                    Outcome outcome = Exchange(true, credential, current, reply);
                    if (outcome == Outcome::Silent)
                        return true;
                    if (outcome != Outcome::Answered)
                        return false;

                    const auto &vb = reply.varbind;
                    if (reply.error_status != common::snmp::ERROR_NONE || vb.IsException())
                        return true;
                    if (!common::snmp::OidInSubtree(vb.oid, root))
                        return true;
                    if (common::snmp::CompareOids(vb.oid, current) <= 0)
                        return true;

                    data[vb.oid] = vb.value;
                    current = vb.oid;
                    ++collected;
                }
                return true;
            }

            const std::optional<common::PhaseError> &Error() const { return m_error; }

        private:
            SnmpTransport &m_transport;
            const std::string &m_ip;
            const common::SnmpConfig &m_config;
            core::ScanContext &m_context;
            int m_failures = 0;
            std::optional<common::PhaseError> m_error;
        };

        struct DeviceOutcome
        {
            std::optional<common::DeviceRecord> record;
            std::optional<common::PhaseError> error;
        };

        DeviceOutcome QueryDevice(SnmpTransport &transport, const std::string &ip,
                                  const common::SnmpConfig &config, core::ScanContext &context)
        {
            DeviceSession session(transport, ip, config, context);

            for (std::size_t i = 0; i < config.credentials.size(); ++i)
            {
                const common::SnmpCredential &credential = config.credentials[i];

                SnmpReply access;
                Outcome outcome = session.Exchange(false, credential, common::OID_SYS_DESCR, access);
                if (outcome == Outcome::Silent)
                    continue;
                if (outcome != Outcome::Answered)
                    return {std::nullopt, session.Error()};

                context.Log().Info(ip + " answered credential #" + std::to_string(i + 1) + " (" +
                                   common::ToString(credential.version) + ")");

                common::SnmpData data;
                if (HasValue(access))
                    data[common::OID_SYS_DESCR] = access.varbind.value;

                bool keep_going = true;
                for (const auto &entry : config.specific_oids)
                {
                    if (data.count(entry.oid))
                        continue;

                    SnmpReply reply;
                    outcome = session.Exchange(false, credential, entry.oid, reply);
                    if (outcome == Outcome::Silent)
                        continue;
                    if (outcome != Outcome::Answered)
                    {
                        keep_going = false;
                        break;
                    }
                    if (HasValue(reply))
                        data[entry.oid] = reply.varbind.value;
                }

                for (const auto &root : config.walk_oids)
                {
                    if (!keep_going)
                        break;
                    keep_going = session.Walk(credential, root, data);
                }

                common::DeviceRecord record;
                record.ip_address = ip;
                record.snmp_data = std::move(data);
                SnmpScanner::Enrich(record);
                return {std::move(record), session.Error()};
            }

            return {std::nullopt, std::nullopt};
        }
    }

    SnmpScanner::SnmpScanner(std::shared_ptr<SnmpTransport> transport) : m_transport(std::move(transport)) {}

    void SnmpScanner::Enrich(common::DeviceRecord &record)
    {
        if (!record.snmp_data)
            return;
        const common::SnmpData &data = *record.snmp_data;

        auto name = data.find(common::OID_SYS_NAME);
        if (name != data.end() && !name->second.empty() && !record.hostname)
            record.hostname = name->second;

        auto descr = data.find(common::OID_SYS_DESCR);
        if (descr != data.end() && !descr->second.empty() && !record.os_info)
            record.os_info = descr->second;

        auto object_id = data.find(common::OID_SYS_OBJECT_ID);
        if (object_id != data.end() && !record.manufacturer)
        {
            if (auto enterprise = common::EnterpriseNumber(object_id->second))
            {
                if (const common::VendorEntry *vendor = common::VendorByEnterprise(*enterprise))
                    record.manufacturer = vendor->name;
            }
        }
    }

    common::PhaseResult SnmpScanner::Scan(const std::vector<std::string> &targets,
                                          const common::DiscoveryConfig &config,
                                          core::ScanContext &context)
    {
        common::PhaseResult result;
        result.phase = common::PhaseId::Snmp;
        result.status = common::ScanStatus::InProgress;
        result.targets_given = targets.size();
        result.strategy_used = "udp";

        auto &log = context.Log();
        log.Info("Querying " + std::to_string(targets.size()) + " candidates with " +
                 std::to_string(config.snmp.credentials.size()) + " credentials");

        std::mutex results_mutex;
        std::size_t device_errors = 0;

        std::size_t skipped = core::RunForEachTarget(
            targets, static_cast<std::size_t>(config.snmp.workers),
            [&context]
            { return context.ShouldStop(); },
            [&](const std::string &ip)
            {
                DeviceOutcome outcome = QueryDevice(*m_transport, ip, config.snmp, context);

                std::lock_guard<std::mutex> lock(results_mutex);
                if (outcome.record)
                    result.observations.push_back(std::move(*outcome.record));
                if (outcome.error)
                {
                    result.errors.push_back(std::move(*outcome.error));
                    ++device_errors;
                }
            });

        std::sort(result.observations.begin(), result.observations.end(),
                  [](const common::DeviceRecord &a, const common::DeviceRecord &b)
                  { return common::IpLess{}(a.ip_address, b.ip_address); });

        if (context.IsCancelled())
        {
            log.Warn("Cancelled, " + std::to_string(skipped) + " candidates not queried");
            result.status = common::ScanStatus::Partial;
        }
        else if (skipped > 0 || context.DeadlineExpired())
        {
            log.Warn("Phase timeout reached, " + std::to_string(skipped) + " candidates not queried");
            result.status = common::ScanStatus::Partial;
        }
        else if (device_errors > 0)
        {
            result.status = common::ScanStatus::Partial;
        }
        else
        {
            result.status = common::ScanStatus::Completed;
        }

        log.Info(std::to_string(result.observations.size()) + " of " + std::to_string(targets.size()) +
                 " candidates answered");
        result.log = log.Lines();
        result.elapsed = context.Elapsed();
        return result;
    }
}

// include/settings/LedgerSettings.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings
{

    /**
     * @brief Что делать при ошибке записи в balance_history
     *
     * STRICT      - откатить всю единицу работы (история в той же транзакции)
     * BEST_EFFORT - залогировать и продолжить; расхождение найдёт сверка
     */
    enum class HistoryWritePolicy
    {
        STRICT,
        BEST_EFFORT
    };

    inline std::string toString(HistoryWritePolicy policy)
    {
        return policy == HistoryWritePolicy::STRICT ? "strict" : "best_effort";
    }

    inline HistoryWritePolicy parseHistoryWritePolicy(const std::string &str)
    {
        if (str == "strict")
            return HistoryWritePolicy::STRICT;
        if (str == "best_effort")
            return HistoryWritePolicy::BEST_EFFORT;
        throw std::invalid_argument("unknown history write policy: " + str);
    }

    /**
     * @brief Настройки ядра леджера
     */
    class LedgerSettings
    {
    public:
        static constexpr std::size_t kDefaultGuardStripes = 64;
        static constexpr std::size_t kDefaultPageLimit = 50;
        static constexpr std::size_t kMaxPageLimit = 1000;

        LedgerSettings() = default;

        LedgerSettings(std::size_t guardStripes,
                       HistoryWritePolicy historyPolicy,
                       bool advisoryPrecheck,
                       std::chrono::seconds reconcileInterval = std::chrono::seconds{300})
            : guardStripes_(guardStripes), historyPolicy_(historyPolicy), advisoryPrecheck_(advisoryPrecheck), reconcileInterval_(reconcileInterval)
        {
            if (reconcileInterval_.count() <= 0)
            {
                throw std::invalid_argument("LedgerSettings: reconcile interval must be positive");
            }
        }

        static LedgerSettings fromEnvironment()
        {
            return LedgerSettings(
                static_cast<std::size_t>(std::stoul(getEnvOrDefault("LEDGER_GUARD_STRIPES", "64"))),
                parseHistoryWritePolicy(getEnvOrDefault("LEDGER_HISTORY_POLICY", "strict")),
                getEnvOrDefault("LEDGER_ADVISORY_PRECHECK", "true") == "true",
                std::chrono::seconds{std::stol(getEnvOrDefault("LEDGER_RECONCILE_INTERVAL_SEC", "300"))});
        }

        /// 0 - внутрипроцессный guard отключён
        std::size_t getGuardStripes() const { return guardStripes_; }
        HistoryWritePolicy getHistoryPolicy() const { return historyPolicy_; }
        bool isAdvisoryPrecheckEnabled() const { return advisoryPrecheck_; }
        std::chrono::seconds getReconcileInterval() const { return reconcileInterval_; }

        std::size_t getDefaultPageLimit() const { return kDefaultPageLimit; }
        std::size_t getMaxPageLimit() const { return kMaxPageLimit; }

    private:
        std::size_t guardStripes_ = kDefaultGuardStripes;
        HistoryWritePolicy historyPolicy_ = HistoryWritePolicy::STRICT;
        bool advisoryPrecheck_ = true;
        std::chrono::seconds reconcileInterval_{300};

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace ledger::settings

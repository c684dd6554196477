#pragma once

#include "Money.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace transfer::domain {

/**
 * @brief Значение в деталях аудита: null | bool | int64 | string | Money | list<string>
 */
using AuditValue = std::variant<std::nullptr_t, bool, int64_t, std::string, Money, std::vector<std::string>>;

/**
 * @brief Типизированные детали аудиторской записи
 *
 * Хранится как упорядоченный словарь, сериализуется в JSON-объект
 * (колонка JSONB). Money пишется десятичной строкой, поэтому при чтении
 * из хранилища возвращается как string.
 */
class AuditDetail {
public:
    using Entries = std::map<std::string, AuditValue>;

    AuditDetail() = default;

    AuditDetail(std::initializer_list<Entries::value_type> init)
        : entries_(init) {}

    AuditDetail& set(const std::string& key, AuditValue value) {
        entries_[key] = std::move(value);
        return *this;
    }

    /**
     * @brief Опциональная строка: nullopt пишется как null
     */
    AuditDetail& setOptional(const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            entries_[key] = *value;
        } else {
            entries_[key] = nullptr;
        }
        return *this;
    }

    bool contains(const std::string& key) const {
        return entries_.count(key) > 0;
    }

    const AuditValue* find(const std::string& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    template <typename T>
    std::optional<T> get(const std::string& key) const {
        auto value = find(key);
        if (value && std::holds_alternative<T>(*value)) {
            return std::get<T>(*value);
        }
        return std::nullopt;
    }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const Entries& entries() const { return entries_; }

    nlohmann::json toJson() const {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [key, value] : entries_) {
            j[key] = valueToJson(value);
        }
        return j;
    }

    static AuditDetail fromJson(const nlohmann::json& j) {
        AuditDetail detail;
        if (!j.is_object()) {
            return detail;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            detail.entries_[it.key()] = valueFromJson(it.value());
        }
        return detail;
    }

private:
    Entries entries_;

    static nlohmann::json valueToJson(const AuditValue& value) {
        return std::visit([](const auto& v) -> nlohmann::json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, Money>) {
                return v.toString();
            } else {
                return v;
            }
        }, value);
    }

    static AuditValue valueFromJson(const nlohmann::json& j) {
        if (j.is_null()) return nullptr;
        if (j.is_boolean()) return j.get<bool>();
        if (j.is_number_integer()) return j.get<int64_t>();
        if (j.is_string()) return j.get<std::string>();
        if (j.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : j) {
                items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            return items;
        }
        // float и вложенные объекты в детали не пишутся, сохраняем как текст
        return j.dump();
    }
};

} // namespace transfer::domain

#pragma once
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace slickwatch {

/*  RecordValue: dynamic tree handed to exporters before serialization
*
*   Leaves may be narrow numeric types, OpenCV matrices and small OpenCV value
*   types, already-safe JSON subtrees, or opaque payloads that no exporter
*   understands. SafeSerializer turns it into plain JSON.
*/
class RecordValue {
public:
    using object_t = std::map<std::string, RecordValue>;
    using array_t = std::vector<RecordValue>;

    // payload of a type nothing downstream can serialize
    struct Opaque {
        std::string type_name;
        std::shared_ptr<const void> payload;
    };

    using value_t = std::variant<std::nullptr_t, bool,
                                 int32_t, int64_t, uint64_t, float, double,
                                 std::string,
                                 cv::Mat, cv::Scalar, cv::Point, cv::Rect,
                                 nlohmann::json,
                                 Opaque,
                                 object_t, array_t>;

    RecordValue() : value_(std::in_place_type<std::nullptr_t>, nullptr) {}
    RecordValue(std::nullptr_t) : value_(std::in_place_type<std::nullptr_t>, nullptr) {}
    RecordValue(const char* v) : value_(std::in_place_type<std::string>, v) {}
    RecordValue(std::string v) : value_(std::in_place_type<std::string>, std::move(v)) {}
    RecordValue(cv::Mat v) : value_(std::in_place_type<cv::Mat>, std::move(v)) {}
    RecordValue(const cv::Scalar& v) : value_(std::in_place_type<cv::Scalar>, v) {}
    RecordValue(const cv::Point& v) : value_(std::in_place_type<cv::Point>, v) {}
    RecordValue(const cv::Rect& v) : value_(std::in_place_type<cv::Rect>, v) {}
    RecordValue(nlohmann::json v) : value_(std::in_place_type<nlohmann::json>, std::move(v)) {}
    RecordValue(Opaque v) : value_(std::in_place_type<Opaque>, std::move(v)) {}
    RecordValue(object_t v) : value_(std::in_place_type<object_t>, std::move(v)) {}
    RecordValue(array_t v) : value_(std::in_place_type<array_t>, std::move(v)) {}

    // bool / integers / floating point, keeping their width
    template <typename T, typename std::enable_if<std::is_arithmetic<T>::value, int>::type = 0>
    RecordValue(T v) : value_(narrow(v)) {}

    static RecordValue object() { return RecordValue(object_t{}); }
    static RecordValue array() { return RecordValue(array_t{}); }

    template <typename T>
    static RecordValue opaque(T v) {
        return RecordValue(Opaque{typeid(T).name(), std::shared_ptr<const void>(std::make_shared<T>(std::move(v)))});
    }

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
    bool is_object() const { return std::holds_alternative<object_t>(value_); }
    bool is_array() const { return std::holds_alternative<array_t>(value_); }

    const value_t& value() const { return value_; }
    value_t& value() { return value_; }

    const object_t& as_object() const { return std::get<object_t>(value_); }
    object_t& as_object() { return std::get<object_t>(value_); }
    const array_t& as_array() const { return std::get<array_t>(value_); }
    array_t& as_array() { return std::get<array_t>(value_); }

    // object member access, turns a null value into an object
    RecordValue& operator[](const std::string& key) {
        if (is_null()) value_.emplace<object_t>();
        return std::get<object_t>(value_)[key];
    }

    // array append, turns a null value into an array
    void push_back(RecordValue v) {
        if (is_null()) value_.emplace<array_t>();
        std::get<array_t>(value_).push_back(std::move(v));
    }

private:
    template <typename T>
    static value_t narrow(T v) {
        if constexpr (std::is_same<T, bool>::value) {
            return value_t(std::in_place_type<bool>, v);
        } else if constexpr (std::is_floating_point<T>::value) {
            if constexpr (sizeof(T) <= sizeof(float)) return value_t(std::in_place_type<float>, static_cast<float>(v));
            else return value_t(std::in_place_type<double>, static_cast<double>(v));
        } else if constexpr (std::is_signed<T>::value) {
            if constexpr (sizeof(T) <= sizeof(int32_t)) return value_t(std::in_place_type<int32_t>, static_cast<int32_t>(v));
            else return value_t(std::in_place_type<int64_t>, static_cast<int64_t>(v));
        } else {
            if constexpr (sizeof(T) < sizeof(int32_t)) return value_t(std::in_place_type<int32_t>, static_cast<int32_t>(v));
            else return value_t(std::in_place_type<uint64_t>, static_cast<uint64_t>(v));
        }
    }

    value_t value_;
};

} // namespace slickwatch

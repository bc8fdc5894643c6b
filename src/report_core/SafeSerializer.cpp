#include "slickwatch/report/SafeSerializer.h"
#include "slickwatch/errors.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

using nlohmann::json;

namespace slickwatch {

namespace {

json finiteOrNull(double v) {
    if (!std::isfinite(v)) return json(nullptr);
    return json(v);
}

// one channel value at p, typed by the matrix depth
json readElement(const uchar* p, int depth) {
    switch (depth) {
        case CV_8U:  return json(static_cast<int>(*reinterpret_cast<const uint8_t*>(p)));
        case CV_8S:  return json(static_cast<int>(*reinterpret_cast<const int8_t*>(p)));
        case CV_16U: return json(static_cast<int>(*reinterpret_cast<const uint16_t*>(p)));
        case CV_16S: return json(static_cast<int>(*reinterpret_cast<const int16_t*>(p)));
        case CV_32S: return json(*reinterpret_cast<const int32_t*>(p));
        case CV_32F: return finiteOrNull(static_cast<double>(*reinterpret_cast<const float*>(p)));
        case CV_64F: return finiteOrNull(*reinterpret_cast<const double*>(p));
        default:     return json(nullptr);
    }
}

json buildLevel(const cv::Mat& m, int level, size_t offset) {
    const int dims = m.dims;
    const int cn = m.channels();
    const size_t esz1 = m.elemSize1();
    json arr = json::array();

    if (level == dims - 1) {
        const int n = m.size[level];
        for (int i = 0; i < n; ++i) {
            const uchar* p = m.data + (offset + static_cast<size_t>(i)) * m.elemSize();
            if (cn == 1) {
                arr.push_back(readElement(p, m.depth()));
            } else {
                json px = json::array();
                for (int c = 0; c < cn; ++c) px.push_back(readElement(p + c * esz1, m.depth()));
                arr.push_back(std::move(px));
            }
        }
        return arr;
    }

    size_t stride = 1;
    for (int d = level + 1; d < dims; ++d) stride *= static_cast<size_t>(m.size[d]);
    for (int i = 0; i < m.size[level]; ++i) {
        arr.push_back(buildLevel(m, level + 1, offset + static_cast<size_t>(i) * stride));
    }
    return arr;
}

json bytesToList(const std::vector<uint8_t>& bytes) {
    json arr = json::array();
    for (uint8_t b : bytes) arr.push_back(static_cast<int>(b));
    return arr;
}

std::string keyPath(const std::string& parent, const std::string& key) {
    return parent + "." + key;
}

std::string indexPath(const std::string& parent, size_t i) {
    return parent + "[" + std::to_string(i) + "]";
}

} // namespace

SafeSerializer::SafeSerializer(SerializerOptions opt) : opt_(std::move(opt)) {}

json SafeSerializer::matToList(const cv::Mat& input) {
    if (input.empty()) return json::array();

    cv::Mat m = input;
#if CV_VERSION_MAJOR >= 4
    if (m.depth() == CV_16F) m.convertTo(m, CV_32F);
#endif
    if (!m.isContinuous()) m = m.clone();
    return buildLevel(m, 0, 0);
}

json SafeSerializer::toSafeTree(const RecordValue& root) const {
    if (root.is_object()) {
        json out = json::object();
        for (const auto& kv : root.as_object()) {
            if (opt_.elided_keys.count(kv.first)) continue;
            out[kv.first] = convert(kv.second, keyPath("$", kv.first));
        }
        return out;
    }
    return convert(root, "$");
}

json SafeSerializer::toSafeTree(const json& root) const {
    if (root.is_object()) {
        json out = json::object();
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (opt_.elided_keys.count(it.key())) continue;
            out[it.key()] = convertJson(it.value());
        }
        return out;
    }
    return convertJson(root);
}

std::string SafeSerializer::dumps(const RecordValue& root) const {
    return toSafeTree(root).dump(opt_.indent, ' ', false, json::error_handler_t::replace);
}

std::string SafeSerializer::dumps(const json& root) const {
    return toSafeTree(root).dump(opt_.indent, ' ', false, json::error_handler_t::replace);
}

json SafeSerializer::convert(const RecordValue& v, const std::string& path) const {
    const RecordValue::value_t& val = v.value();

    if (std::holds_alternative<std::nullptr_t>(val)) return json(nullptr);
    if (auto p = std::get_if<bool>(&val))     return json(*p);
    if (auto p = std::get_if<int32_t>(&val))  return json(*p);
    if (auto p = std::get_if<int64_t>(&val))  return json(*p);
    if (auto p = std::get_if<uint64_t>(&val)) return json(*p);
    if (auto p = std::get_if<float>(&val))    return finiteOrNull(static_cast<double>(*p));
    if (auto p = std::get_if<double>(&val))   return finiteOrNull(*p);
    if (auto p = std::get_if<std::string>(&val)) return json(*p);

    if (auto p = std::get_if<cv::Mat>(&val)) return matToList(*p);
    if (auto p = std::get_if<cv::Scalar>(&val)) {
        json arr = json::array();
        for (int i = 0; i < 4; ++i) arr.push_back(finiteOrNull((*p)[i]));
        return arr;
    }
    if (auto p = std::get_if<cv::Point>(&val)) return json::array({p->x, p->y});
    if (auto p = std::get_if<cv::Rect>(&val)) {
        return json{{"x", p->x}, {"y", p->y}, {"width", p->width}, {"height", p->height}};
    }

    if (auto p = std::get_if<json>(&val)) return convertJson(*p);

    if (auto p = std::get_if<RecordValue::Opaque>(&val)) {
        throw PipelineError(ErrorKind::UnsupportedSerializationType, "serialize",
                            "cannot serialize value of type " + p->type_name + " at " + path);
    }

    if (auto p = std::get_if<RecordValue::object_t>(&val)) {
        json out = json::object();
        for (const auto& kv : *p) out[kv.first] = convert(kv.second, keyPath(path, kv.first));
        return out;
    }
    if (auto p = std::get_if<RecordValue::array_t>(&val)) {
        json out = json::array();
        for (size_t i = 0; i < p->size(); ++i) out.push_back(convert((*p)[i], indexPath(path, i)));
        return out;
    }

    throw PipelineError(ErrorKind::UnsupportedSerializationType, "serialize",
                        "unrecognized value at " + path);
}

json SafeSerializer::convertJson(const json& v) const {
    switch (v.type()) {
        case json::value_t::object: {
            json out = json::object();
            for (auto it = v.begin(); it != v.end(); ++it) out[it.key()] = convertJson(it.value());
            return out;
        }
        case json::value_t::array: {
            json out = json::array();
            for (const auto& e : v) out.push_back(convertJson(e));
            return out;
        }
        case json::value_t::binary:
            return bytesToList(v.get_binary());
        case json::value_t::number_float:
            return finiteOrNull(v.get<double>());
        case json::value_t::discarded:
            return json(nullptr);
        default:
            return v;
    }
}

} // namespace slickwatch

/**
 * @file Serialize.cpp
 * @brief JSON / TOML / YAML serialization of document trees
 */

#include "confmerge/Serialize.hpp"
#include "confmerge/Parse.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace confmerge {

// ---- JSON -> TOML (value-based construction; no raw nodes) -----------------
namespace {

    toml::array make_array_from_json(const Value& a); // fwd
    toml::table make_table_from_json(const Value& o); // fwd

    // Integers above int64 range fall back to double
    template <typename Insert>
    void insert_scalar(const Value& v, Insert&& insert) {
        if (v.is_string()) {
            insert(v.get<std::string>());
        } else if (v.is_boolean()) {
            insert(v.get<bool>());
        } else if (v.is_number_unsigned()) {
            const auto u = v.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                insert(static_cast<std::int64_t>(u));
            } else {
                insert(static_cast<double>(u));
            }
        } else if (v.is_number_integer()) {
            insert(v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            insert(v.get<double>());
        } else {
            // No TOML null
            insert(std::string{""});
        }
    }

    toml::array make_array_from_json(const Value& a) {
        toml::array out;
        for (const auto& elem : a) {
            if (elem.is_object()) {
                out.push_back(make_table_from_json(elem));
            } else if (elem.is_array()) {
                out.push_back(make_array_from_json(elem));
            } else {
                insert_scalar(elem, [&](auto&& x) { out.push_back(x); });
            }
        }
        return out;
    }

    toml::table make_table_from_json(const Value& o) {
        toml::table tbl;
        for (auto it = o.begin(); it != o.end(); ++it) {
            const auto& k = it.key();
            const auto& v = it.value();
            if (v.is_object()) {
                tbl.insert(k, make_table_from_json(v));
            } else if (v.is_array()) {
                tbl.insert(k, make_array_from_json(v));
            } else {
                insert_scalar(v, [&](auto&& x) { tbl.insert(k, x); });
            }
        }
        return tbl;
    }

    toml::table json_to_toml(const Value& j) {
        // TOML requires a table at the root
        if (j.is_object()) return make_table_from_json(j);
        toml::table root;
        if (j.is_array()) root.insert("value", make_array_from_json(j));
        else insert_scalar(j, [&](auto&& x) { root.insert("value", x); });
        return root;
    }

    // ---- JSON -> YAML --------------------------------------------------------

    void emit_yaml(YAML::Emitter& out, const Value& v) {
        switch (v.type()) {
            case Value::value_t::object:
                out << YAML::BeginMap;
                for (auto it = v.begin(); it != v.end(); ++it) {
                    out << YAML::Key << it.key() << YAML::Value;
                    emit_yaml(out, it.value());
                }
                out << YAML::EndMap;
                break;

            case Value::value_t::array:
                out << YAML::BeginSeq;
                for (const auto& elem : v) {
                    emit_yaml(out, elem);
                }
                out << YAML::EndSeq;
                break;

            case Value::value_t::string: {
                const auto& s = v.get_ref<const std::string&>();
                if (!parse_scalar(s).is_string()) {
                    out << YAML::DoubleQuoted << s;
                } else {
                    out << s;
                }
                break;
            }

            case Value::value_t::boolean:
                out << v.get<bool>();
                break;

            case Value::value_t::number_integer:
                out << v.get<std::int64_t>();
                break;

            case Value::value_t::number_unsigned:
                out << v.get<std::uint64_t>();
                break;

            case Value::value_t::number_float:
                out << v.get<double>();
                break;

            default:
                out << YAML::Null;
                break;
        }
    }

} // namespace

std::string dump_document(const Value& doc, Format format, int indent) {
    switch (format) {
        case Format::Json:
            return doc.dump(indent) + "\n";

        case Format::Toml: {
            std::ostringstream oss;
            oss << json_to_toml(doc) << "\n";
            return oss.str();
        }

        case Format::Yaml: {
            YAML::Emitter out;
            out.SetIndent(static_cast<std::size_t>(indent));
            emit_yaml(out, doc);
            if (!out.good()) {
                throw std::runtime_error("YAML emitter error: " + out.GetLastError());
            }
            return std::string(out.c_str()) + "\n";
        }
    }
    return std::string();
}

void write_document_file(const std::string& path, const Value& doc, Format format) {
    std::ofstream ofs(path);
    if (!ofs) throw std::runtime_error("Failed to open for write: " + path);
    ofs << dump_document(doc, format);
}

} // namespace confmerge

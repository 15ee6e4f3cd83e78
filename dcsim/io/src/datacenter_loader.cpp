#include <dcsim/io/datacenter_loader.hpp>
#include <dcsim/io/error.hpp>

#include "json_fields.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

namespace dcsim::io {

namespace {

using namespace detail;

core::Resources parse_capacity(const rapidjson::Value& obj, const std::string& ctx) {
    core::Resources capacity;
    capacity.cpu = get_uint64(obj, "cpu", ctx);
    capacity.ram = get_uint64(obj, "ram", ctx);
    capacity.gpu = get_uint64_or(obj, "gpu", 0, ctx);
    if (capacity.empty()) {
        throw LoaderError("host has no capacity", ctx);
    }
    return capacity;
}

} // namespace

DatacenterData load_datacenter(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_datacenter_from_string(oss.str());
}

DatacenterData load_datacenter_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_document(doc, json, "datacenter");

    DatacenterData result;
    if (doc.HasMember("name")) {
        result.name = get_string(doc, "name", "datacenter");
    }

    std::unordered_set<std::string> seen;
    const auto& hosts = get_array(doc, "hosts", "datacenter");
    for (rapidjson::SizeType idx = 0; idx < hosts.Size(); ++idx) {
        const auto& host = hosts[idx];
        std::string ctx = element_path("", "hosts", idx);
        if (!host.IsObject()) {
            throw LoaderError("host must be an object", ctx);
        }

        std::string name = get_string(host, "name", ctx);
        core::Resources capacity = parse_capacity(host, ctx);
        uint64_t count = get_uint64_or(host, "count", 1, ctx);
        if (count == 0) {
            throw LoaderError("count must be at least 1", ctx);
        }

        for (uint64_t i = 0; i < count; ++i) {
            std::string pm_name = count == 1 ? name : name + "-" + std::to_string(i);
            if (!seen.insert(pm_name).second) {
                throw LoaderError("duplicate host name '" + pm_name + "'", ctx);
            }
            result.hosts.push_back(HostSpec{std::move(pm_name), capacity});
        }
    }

    if (result.hosts.empty()) {
        throw LoaderError("at least one host is required", "datacenter");
    }
    return result;
}

void apply_datacenter(core::Simulation& simulation, const DatacenterData& data) {
    for (const auto& host : data.hosts) {
        simulation.add_pm(host.name, host.capacity);
    }
}

} // namespace dcsim::io

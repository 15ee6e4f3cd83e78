#include <dcsim/io/datacenter_loader.hpp>
#include <dcsim/io/error.hpp>
#include <dcsim/core/simulation.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace dcsim::io;
using namespace dcsim::core;

class DatacenterLoaderTest : public ::testing::Test {
protected:
    std::string error_of(const char* json) {
        try {
            (void)load_datacenter_from_string(json);
        } catch (const LoaderError& e) {
            return e.what();
        }
        return "";
    }
};

TEST_F(DatacenterLoaderTest, LoadBasic) {
    const char* json = R"({
        "name": "edge",
        "hosts": [
            {"name": "big", "cpu": 32, "ram": 131072, "gpu": 2},
            {"name": "small", "cpu": 4, "ram": 8192}
        ]
    })";

    auto data = load_datacenter_from_string(json);

    EXPECT_EQ(data.name, "edge");
    ASSERT_EQ(data.hosts.size(), 2U);
    EXPECT_EQ(data.hosts[0].name, "big");
    EXPECT_EQ(data.hosts[0].capacity, (Resources{32, 131072, 2}));
    EXPECT_EQ(data.hosts[1].capacity, (Resources{4, 8192, 0}));
}

TEST_F(DatacenterLoaderTest, CountExpandsHosts) {
    auto data = load_datacenter_from_string(R"({
        "hosts": [{"name": "rack", "cpu": 16, "ram": 65536, "count": 3}]
    })");

    ASSERT_EQ(data.hosts.size(), 3U);
    EXPECT_EQ(data.hosts[0].name, "rack-0");
    EXPECT_EQ(data.hosts[2].name, "rack-2");
    EXPECT_TRUE(data.name.empty());
}

TEST_F(DatacenterLoaderTest, ApplyAddsPmsInOrder) {
    auto data = load_datacenter_from_string(R"({
        "hosts": [
            {"name": "a", "cpu": 8, "ram": 1024},
            {"name": "b", "cpu": 2, "ram": 2048, "count": 2}
        ]
    })");

    Simulation sim;
    apply_datacenter(sim, data);

    auto pms = sim.datacenter().pms();
    ASSERT_EQ(pms.size(), 3U);
    EXPECT_EQ(pms[0].name, "a");
    EXPECT_EQ(pms[1].name, "b-0");
    EXPECT_EQ(pms[2].id, PmId{2});
    EXPECT_EQ(pms[2].capacity, (Resources{2, 2048, 0}));
}

TEST_F(DatacenterLoaderTest, MalformedJson) {
    EXPECT_THROW(load_datacenter_from_string("{ not json"), LoaderError);
    EXPECT_THROW(load_datacenter_from_string("[]"), LoaderError);
}

TEST_F(DatacenterLoaderTest, MissingFieldNamesItsPath) {
    auto message = error_of(R"({"hosts": [{"name": "a", "cpu": 1, "ram": 1}, {"name": "b", "cpu": 1}]})");
    EXPECT_EQ(message, "hosts[1]: missing required field 'ram'");
}

TEST_F(DatacenterLoaderTest, WrongTypes) {
    EXPECT_EQ(error_of(R"({"hosts": [{"name": "a", "cpu": -1, "ram": 1}]})"),
              "hosts[0]: field 'cpu' must be a non-negative integer");
    EXPECT_EQ(error_of(R"({"hosts": [{"name": 7, "cpu": 1, "ram": 1}]})"),
              "hosts[0]: field 'name' must be a string");
    EXPECT_EQ(error_of(R"({"hosts": {}})"), "datacenter: field 'hosts' must be an array");
}

TEST_F(DatacenterLoaderTest, ValidationErrors) {
    EXPECT_EQ(error_of(R"({"hosts": []})"), "datacenter: at least one host is required");
    EXPECT_EQ(error_of(R"({"hosts": [{"name": "a", "cpu": 0, "ram": 0}]})"),
              "hosts[0]: host has no capacity");
    EXPECT_EQ(error_of(R"({"hosts": [{"name": "a", "cpu": 1, "ram": 1, "count": 0}]})"),
              "hosts[0]: count must be at least 1");
}

TEST_F(DatacenterLoaderTest, DuplicateNamesAfterExpansion) {
    auto message = error_of(R"({"hosts": [
        {"name": "rack", "cpu": 1, "ram": 1, "count": 2},
        {"name": "rack-1", "cpu": 1, "ram": 1}
    ]})");
    EXPECT_EQ(message, "hosts[1]: duplicate host name 'rack-1'");
}

TEST_F(DatacenterLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "dcsim_test_datacenter.json";
    {
        std::ofstream file(path);
        file << R"({"hosts": [{"name": "only", "cpu": 4, "ram": 4096}]})";
    }

    auto data = load_datacenter(path);
    std::filesystem::remove(path);

    ASSERT_EQ(data.hosts.size(), 1U);
    EXPECT_EQ(data.hosts[0].name, "only");
}

TEST_F(DatacenterLoaderTest, MissingFile) {
    EXPECT_THROW(load_datacenter("/nonexistent/dcsim/datacenter.json"), LoaderError);
}

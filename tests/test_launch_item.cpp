#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "launch_item.h"

using namespace netlaunch;

class LaunchItemTest : public ::testing::Test {
protected:
    static LaunchItem make_item(const std::string& protocol, std::optional<int> port = std::nullopt,
                                std::optional<std::string> path = std::nullopt) {
        LaunchItem item;
        item.id = "item";
        item.protocol = protocol;
        item.port = port;
        item.path = path;
        item.network_addresses.local = "192.168.1.20";
        return item;
    }
};

TEST_F(LaunchItemTest, ProfileNamesTest) {
    EXPECT_STREQ(profile_to_string(NetworkProfile::LOCAL), "local");
    EXPECT_STREQ(profile_to_string(NetworkProfile::TAILSCALE), "tailscale");
    EXPECT_EQ(profile_from_string("vpn"), NetworkProfile::VPN);
    EXPECT_EQ(profile_from_string("custom"), NetworkProfile::CUSTOM);
    EXPECT_FALSE(profile_from_string("wifi").has_value());

    EXPECT_THAT(profiles_in_preference_order(),
                ::testing::ElementsAre(NetworkProfile::LOCAL, NetworkProfile::TAILSCALE,
                                       NetworkProfile::VPN, NetworkProfile::CUSTOM));
}

TEST_F(LaunchItemTest, BuildUrlForHostTest) {
    EXPECT_EQ(build_url_for_host(make_item("http", 8080, std::string("admin")), "nas.local"),
              "http://nas.local:8080/admin");
    EXPECT_EQ(build_url_for_host(make_item("https", std::nullopt, std::string("/ui/")), "nas.local"),
              "https://nas.local/ui/");
    EXPECT_EQ(build_url_for_host(make_item("ssh", 22), "10.0.0.2"), "ssh://10.0.0.2:22");
}

// http on 80 and https on 443 omit the port, other combinations keep it
TEST_F(LaunchItemTest, DefaultPortsAreOmittedTest) {
    EXPECT_EQ(build_url_for_host(make_item("http", 80), "h"), "http://h");
    EXPECT_EQ(build_url_for_host(make_item("https", 443), "h"), "https://h");
    EXPECT_EQ(build_url_for_host(make_item("http", 443), "h"), "http://h:443");
    EXPECT_EQ(build_url_for_host(make_item("https", 80), "h"), "https://h:80");
}

TEST_F(LaunchItemTest, IPv6HostsAreBracketedTest) {
    EXPECT_EQ(build_url_for_host(make_item("http", 8080), "fd7a:115c::1"), "http://[fd7a:115c::1]:8080");
    EXPECT_EQ(build_url_for_host(make_item("http", 8080), "[fe80::1]"), "http://[fe80::1]:8080");
}

TEST_F(LaunchItemTest, ProtocolDefaultsToHttpsTest) {
    LaunchItem item;
    item.id = "no-protocol";
    EXPECT_EQ(item.effective_protocol(), "https");
    EXPECT_EQ(build_url_for_host(item, "example.lan"), "https://example.lan");

    item.protocol = std::string();
    EXPECT_EQ(item.effective_protocol(), "https");
}

TEST_F(LaunchItemTest, AboutAndMailtoFormTest) {
    EXPECT_EQ(build_url_for_host(make_item("mailto"), "ops@example.com"), "mailto:ops@example.com");
    EXPECT_EQ(build_url_for_host(make_item("about", std::nullopt, std::string("blank")), ""), "about:blank");
}

TEST_F(LaunchItemTest, HostFallbackPerProfileTest) {
    NetworkAddressSet addresses;
    addresses.local = "192.168.1.20";
    addresses.vpn = "10.8.0.20";

    EXPECT_EQ(addresses.host_for_profile(NetworkProfile::LOCAL), "192.168.1.20");
    EXPECT_EQ(addresses.host_for_profile(NetworkProfile::TAILSCALE), "192.168.1.20");
    EXPECT_EQ(addresses.host_for_profile(NetworkProfile::VPN), "10.8.0.20");
    EXPECT_EQ(addresses.host_for_profile(NetworkProfile::CUSTOM), "192.168.1.20");

    EXPECT_EQ(addresses.address_for(NetworkProfile::LOCAL), "192.168.1.20");
    EXPECT_FALSE(addresses.address_for(NetworkProfile::TAILSCALE).has_value());

    // Local falls back through tailscale, then vpn
    NetworkAddressSet remote_only;
    remote_only.vpn = "10.8.0.20";
    EXPECT_EQ(remote_only.host_for_profile(NetworkProfile::LOCAL), "10.8.0.20");
    remote_only.tailscale = "100.64.0.20";
    EXPECT_EQ(remote_only.host_for_profile(NetworkProfile::LOCAL), "100.64.0.20");

    // Empty strings count as unset
    NetworkAddressSet empty;
    empty.local = "";
    EXPECT_FALSE(empty.host_for_profile(NetworkProfile::LOCAL).has_value());
    EXPECT_FALSE(empty.host_for_profile(NetworkProfile::CUSTOM).has_value());
}

TEST_F(LaunchItemTest, BuildUrlStrictAndFallbackTest) {
    LaunchItem item = make_item("http", 8080);

    EXPECT_EQ(build_url(item, NetworkProfile::TAILSCALE), "http://192.168.1.20:8080");
    EXPECT_FALSE(build_profile_url(item, NetworkProfile::TAILSCALE).has_value());
    EXPECT_EQ(build_profile_url(item, NetworkProfile::LOCAL), "http://192.168.1.20:8080");

    LaunchItem unconfigured;
    unconfigured.id = "none";
    EXPECT_FALSE(build_url(unconfigured, NetworkProfile::LOCAL).has_value());
}

TEST_F(LaunchItemTest, JsonFormTest) {
    auto json = nlohmann::json::parse(R"({
        "id": "grafana",
        "networkAddresses": {"local": "192.168.1.5", "tailscale": "100.64.0.5"},
        "protocol": "http",
        "port": 3000,
        "path": "d/home"
    })");

    LaunchItem item = json.get<LaunchItem>();
    EXPECT_EQ(item.id, "grafana");
    EXPECT_EQ(item.network_addresses.local, "192.168.1.5");
    EXPECT_EQ(item.network_addresses.tailscale, "100.64.0.5");
    EXPECT_FALSE(item.network_addresses.vpn.has_value());
    EXPECT_EQ(item.port, 3000);
    EXPECT_EQ(build_url(item, NetworkProfile::LOCAL), "http://192.168.1.5:3000/d/home");

    nlohmann::json back = item;
    EXPECT_EQ(back, json);

    EXPECT_THROW(nlohmann::json::parse(R"({"protocol": "http"})").get<LaunchItem>(), nlohmann::json::exception);
}

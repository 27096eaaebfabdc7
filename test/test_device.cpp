#include <gtest/gtest.h>

#include "ssdp/device.hpp"

static const char* uuid = "uuid:ad8782a0-9e28-422b-a6ae-670fe7c4c043";
static const char* location = "http://192.168.1.100:8080/desc.xml";

TEST(ssdp_device, Usn)
{
    ssdp::device root {uuid, "upnp:rootdevice", location};
    ASSERT_EQ(std::string {uuid} + "::upnp:rootdevice", root.usn);

    ssdp::device bare {uuid, "", location};
    ASSERT_EQ(uuid, bare.usn);
    ASSERT_EQ(location, bare.location);
}

TEST(ssdp_device_registry, FindIgnoresCase)
{
    ssdp::device_registry registry {{
        ssdp::device {uuid, "upnp:rootdevice", location},
        ssdp::device {uuid, "urn:schemas-upnp-org:device:MediaServer:1", location}
    }};

    const ssdp::device* dev = registry.find_by_target("URN:schemas-upnp-org:device:mediaserver:1");
    ASSERT_NE(nullptr, dev);
    ASSERT_EQ("urn:schemas-upnp-org:device:MediaServer:1", dev->search_target);

    ASSERT_EQ(nullptr, registry.find_by_target("ssdp:all"));
    ASSERT_EQ(nullptr, registry.find_by_target(""));
}

TEST(ssdp_device_registry, FirstMatchWins)
{
    ssdp::device_registry registry {{
        ssdp::device {"uuid:first", "upnp:rootdevice", "http://first/desc.xml"},
        ssdp::device {"uuid:second", "UPNP:ROOTDEVICE", "http://second/desc.xml"}
    }};

    ASSERT_EQ(2u, registry.size());

    const ssdp::device* dev = registry.find_by_target("upnp:rootdevice");
    ASSERT_NE(nullptr, dev);
    ASSERT_EQ("uuid:first", dev->unique_id);
}

TEST(ssdp_device_registry, EmptySearchTarget)
{
    ssdp::device_registry registry {{ssdp::device {uuid, "", location}}};

    const ssdp::device* dev = registry.find_by_target("");
    ASSERT_NE(nullptr, dev);
    ASSERT_EQ(uuid, dev->usn);
}

TEST(ssdp_device_registry, KeepsRegistrationOrder)
{
    ssdp::device_registry registry {{
        ssdp::device {"uuid:a", "st:a", location},
        ssdp::device {"uuid:b", "st:b", location},
        ssdp::device {"uuid:c", "st:c", location}
    }};

    std::string order;
    for(const auto& dev : registry)
        order += dev.unique_id.back();
    ASSERT_EQ("abc", order);
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

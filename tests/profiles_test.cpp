#include "profiles.hpp"

#include <gtest/gtest.h>

namespace profiles {
namespace {

using arbiter::Profile;

TEST(ProfilesTest, BusNamesFollowProfile) {
    EXPECT_EQ(service_name(Profile::ClassicMedia), "org.audioarbiter.ClassicMedia");
    EXPECT_EQ(object_path(Profile::LeAudio), "/org/audioarbiter/LeAudio");
}

TEST(FallbackCacheTest, EmptyUntilStored) {
    FallbackCache cache;
    EXPECT_EQ(cache.get(Profile::ClassicMedia), std::nullopt);

    cache.store(Profile::ClassicMedia, std::string("A"));
    cache.store(Profile::ClassicCall, std::string("H"));
    EXPECT_EQ(cache.get(Profile::ClassicMedia), "A");
    EXPECT_EQ(cache.get(Profile::ClassicCall), "H");

    cache.store(Profile::ClassicMedia, std::nullopt);
    EXPECT_EQ(cache.get(Profile::ClassicMedia), std::nullopt);
}

} // namespace
} // namespace profiles

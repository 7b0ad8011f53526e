#include "pipewire.hpp"

#include <gtest/gtest.h>

namespace pipewire {
namespace {

TEST(WiredOutputTest, FormFactorMarksHeadphones) {
    EXPECT_TRUE(is_wired_output("alsa_output.pci-0000_00_1f.3.analog-stereo", "headphone"));
    EXPECT_TRUE(is_wired_output("alsa_output.pci-0000_00_1f.3.analog-stereo", "headset"));
    EXPECT_FALSE(is_wired_output("alsa_output.pci-0000_00_1f.3.analog-stereo", "internal"));
    EXPECT_FALSE(is_wired_output("alsa_output.pci-0000_00_1f.3.hdmi-stereo", ""));
}

TEST(WiredOutputTest, NameMarksUsbAndHeadsets) {
    EXPECT_TRUE(is_wired_output("alsa_output.usb-Generic_USB_Audio-00.analog-stereo", ""));
    EXPECT_TRUE(is_wired_output("alsa_output.USB-Audio.analog-stereo", ""));
    EXPECT_TRUE(is_wired_output("alsa_output.pci-0000_00_1f.3.Headphones", ""));
}

TEST(WiredOutputTest, OnlyAlsaSinksCount) {
    EXPECT_FALSE(is_wired_output("bluez_output.AA_BB_CC_DD_EE_FF.1", "headset"));
    EXPECT_FALSE(is_wired_output("usb_headset_sink", "headphone"));
    EXPECT_FALSE(is_wired_output("", ""));
}

TEST(WiredOutputTest, NonAsciiNamesAreSafe) {
    EXPECT_FALSE(is_wired_output("alsa_output.\xc3\xa9" "cran-stereo", ""));
    EXPECT_TRUE(is_wired_output("alsa_output.\xff\x80-usb", ""));
}

} // namespace
} // namespace pipewire

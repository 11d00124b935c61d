#include "vk_types.h"

#include <gtest/gtest.h>
#include <string>

using namespace vkg;

TEST(VulkanError, MessageNamesTheResultAndTheCall) {
    const VulkanError e(VK_ERROR_DEVICE_LOST, "vkQueueSubmit(frame)");
    const std::string what = e.what();
    EXPECT_NE(what.find("VK_ERROR_DEVICE_LOST"), std::string::npos);
    EXPECT_NE(what.find("vkQueueSubmit(frame)"), std::string::npos);
    EXPECT_NE(what.find("(-4)"), std::string::npos);
    EXPECT_TRUE(e.is_device_lost());
    EXPECT_FALSE(e.is_timeout());
}

TEST(VulkanError, TimeoutAndNotReadyCountAsTimeouts) {
    EXPECT_TRUE(VulkanError(VK_TIMEOUT, "wait").is_timeout());
    EXPECT_TRUE(VulkanError(VK_NOT_READY, "acquire").is_timeout());
    EXPECT_FALSE(VulkanError(VK_ERROR_OUT_OF_DEVICE_MEMORY, "alloc").is_timeout());
    EXPECT_NE(std::string(VulkanError(VK_TIMEOUT, "wait").what()).find("VK_TIMEOUT"), std::string::npos);
}

TEST(VulkanError, OutOfDateIsRecognised) {
    const VulkanError e(VK_ERROR_OUT_OF_DATE_KHR, "vkAcquireNextImageKHR");
    EXPECT_TRUE(e.is_out_of_date());
    EXPECT_NE(std::string(e.what()).find("VK_ERROR_OUT_OF_DATE_KHR"), std::string::npos);
}

TEST(VkCheck, ThrowsVulkanErrorWithTheFailingResult) {
    auto fails = [] { VK_CHECK(VK_ERROR_INITIALIZATION_FAILED); };
    try {
        fails();
        FAIL() << "VK_CHECK did not throw";
    } catch (const VulkanError& e) {
        EXPECT_EQ(e.result(), VK_ERROR_INITIALIZATION_FAILED);
    }
    EXPECT_NO_THROW(VK_CHECK(VK_SUCCESS));
}

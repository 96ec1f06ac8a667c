#include <gtest/gtest.h>
#include "transport/contact.hpp"

using namespace bmc_2d;

TEST(ContactTest, ClassifiesLayers) {
    EXPECT_EQ(classify_layer(0, 2).kind, ContactKind::DEVICE_BOUNDARY);
    EXPECT_EQ(classify_layer(2, 2).kind, ContactKind::GROUNDED);

    ContactClass floating = classify_layer(3, 2);
    EXPECT_EQ(floating.kind, ContactKind::FLOATING);
    EXPECT_EQ(floating.layer, 3);

    // The injection contact is floating unless it is also grounded
    EXPECT_EQ(classify_layer(1, 2).kind, ContactKind::FLOATING);
    EXPECT_EQ(classify_layer(1, 1).kind, ContactKind::GROUNDED);
}

TEST(ContactTest, KindNames) {
    EXPECT_EQ(contact_kind_to_string(ContactKind::DEVICE_BOUNDARY), "device_boundary");
    EXPECT_EQ(contact_kind_to_string(ContactKind::GROUNDED), "grounded");
    EXPECT_EQ(contact_kind_to_string(ContactKind::FLOATING), "floating");
}

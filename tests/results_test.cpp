/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "negsim/results.hpp"

using namespace negsim;

class ResultProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Product widget;
        widget.id = "p1";
        widget.name = "WidgetA";
        widget.targetPrice = 12.0;
        widget.minPrice = 10.0;
        widget.maxPrice = 15.0;
        widget.volume = 100;
        products_.push_back(widget);
    }

    ResultArtifacts process(const DimensionValues& offer, Role role = Role::Buyer) {
        return processResults({offer, conversation_, products_, dimensions_, role});
    }

    std::vector<Product> products_;
    std::vector<Dimension> dimensions_;
    std::vector<RoundUpdate> conversation_;
};

TEST_F(ResultProcessorTest, PriceKeyMatchesProductByName) {
    auto result = process({{"Preis_WidgetA", "12.5"}});

    ASSERT_TRUE(result.dealValue.has_value());
    EXPECT_EQ(*result.dealValue, "1250.00");
    ASSERT_EQ(result.products.size(), 1u);
    EXPECT_EQ(result.products[0].dimensionKey, "Preis_WidgetA");
    EXPECT_DOUBLE_EQ(result.products[0].subtotal, 1250.0);
    EXPECT_TRUE(result.otherDimensions.empty());
}

TEST_F(ResultProcessorTest, NoMatchingKeyLeavesDealValueNull) {
    auto result = process({{"Lieferzeit", "14 Tage"}});

    EXPECT_FALSE(result.dealValue.has_value());
    EXPECT_TRUE(result.products.empty());
    ASSERT_EQ(result.otherDimensions.size(), 1u);
    EXPECT_EQ(result.otherDimensions[0].key, "Lieferzeit");
    ASSERT_TRUE(result.otherDimensions[0].numeric.has_value());
    EXPECT_DOUBLE_EQ(*result.otherDimensions[0].numeric, 14.0);
    EXPECT_EQ(result.entryKeys, (std::vector<std::string>{"Lieferzeit"}));
}

TEST_F(ResultProcessorTest, DecimalCommaAndUnitsAreTolerated) {
    auto result = process({{"WidgetA", "11,50 EUR"}});

    ASSERT_TRUE(result.dealValue.has_value());
    EXPECT_EQ(*result.dealValue, "1150.00");
}

TEST_F(ResultProcessorTest, ConversationFillsKeysMissingFromFinalOffer) {
    RoundUpdate early;
    early.round = 1;
    early.offer = {{"Preis_WidgetA", "14"}, {"Zahlungsziel", "60"}};
    RoundUpdate late;
    late.round = 2;
    late.offer = {{"Preis_WidgetA", "11"}};
    conversation_ = {early, late};

    auto result = process({{"Zahlungsziel", "30"}});

    ASSERT_TRUE(result.dealValue.has_value());
    EXPECT_EQ(*result.dealValue, "1100.00");
    ASSERT_EQ(result.otherDimensions.size(), 1u);
    EXPECT_EQ(result.otherDimensions[0].raw, "30") << "final offer wins over earlier rounds";
}

TEST_F(ResultProcessorTest, FuzzyMatchSkipsTotals) {
    Product master;
    master.id = "p2";
    master.name = "Widgetmaster";
    master.volume = 10;
    products_ = {master};

    auto result = process({{"Widgetmaster_Gesamt", "5000"}, {"Widgetm", "25"}});

    ASSERT_EQ(result.products.size(), 1u);
    EXPECT_EQ(result.products[0].dimensionKey, "Widgetm");
    EXPECT_EQ(*result.dealValue, "250.00");
    ASSERT_EQ(result.otherDimensions.size(), 1u);
    EXPECT_EQ(result.otherDimensions[0].key, "Widgetmaster_Gesamt");
}

TEST_F(ResultProcessorTest, BuyerIgnoresPriceFloor) {
    auto buyer = process({{"WidgetA", "9"}}, Role::Buyer);
    ASSERT_EQ(buyer.products.size(), 1u);
    EXPECT_TRUE(buyer.products[0].withinZopa);

    auto seller = process({{"WidgetA", "9"}}, Role::Seller);
    ASSERT_EQ(seller.products.size(), 1u);
    EXPECT_FALSE(seller.products[0].withinZopa);
    EXPECT_DOUBLE_EQ(seller.products[0].deltaFromBounds, -1.0);
}

TEST_F(ResultProcessorTest, PerformanceScoreTracksTarget) {
    auto onTarget = process({{"WidgetA", "12"}});
    EXPECT_DOUBLE_EQ(onTarget.products[0].performanceScore, 100.0);
    ASSERT_TRUE(onTarget.products[0].priceVsTarget.has_value());
    EXPECT_DOUBLE_EQ(*onTarget.products[0].priceVsTarget, 0.0);

    auto above = process({{"WidgetA", "18"}});
    // 50% off target, outside the ceiling
    EXPECT_DOUBLE_EQ(above.products[0].performanceScore, 40.0);
    EXPECT_FALSE(above.products[0].withinZopa);
}

TEST_F(ResultProcessorTest, DimensionRowsUseMatchOrFallback) {
    Dimension delivery;
    delivery.name = "Lieferzeit";
    delivery.minValue = 7;
    delivery.maxValue = 21;
    delivery.targetValue = 14;
    delivery.priority = 1;
    Dimension warranty;
    warranty.name = "Garantie";
    warranty.targetValue = 24;
    dimensions_ = {delivery, warranty};

    auto result = process({{"Lieferzeit in Tagen", "10"}, {"WidgetA", "12"}});

    ASSERT_EQ(result.dimensions.size(), 2u);
    EXPECT_DOUBLE_EQ(result.dimensions[0].finalValue, 10.0);
    EXPECT_TRUE(result.dimensions[0].achievedTarget);
    EXPECT_EQ(result.dimensions[0].priority, 1);
    EXPECT_DOUBLE_EQ(result.dimensions[1].finalValue, 24.0);
    EXPECT_EQ(result.dimensions[1].priority, 3);
}

TEST(ResultHelpersTest, NormalizeKeyFoldsGermanText) {
    EXPECT_EQ(normalizeKey("Größe Ä"), "groesseae");
    EXPECT_EQ(normalizeKey("Preis_Widget-A"), "preiswidgeta");
    EXPECT_EQ(normalizeKey("Café"), "cafe");
}

TEST(ResultHelpersTest, CoerceNumberTakesFirstNumber) {
    EXPECT_DOUBLE_EQ(*coerceNumber("12,50 EUR"), 12.5);
    EXPECT_DOUBLE_EQ(*coerceNumber("-3.5%"), -3.5);
    EXPECT_DOUBLE_EQ(*coerceNumber("ca. 30 Tage"), 30.0);
    EXPECT_FALSE(coerceNumber("keine Angabe").has_value());
    EXPECT_FALSE(coerceNumber("  ").has_value());
}

TEST(ResultHelpersTest, RecordsCarryKinds) {
    ResultArtifacts artifacts;
    ProductResult product;
    product.productId = "p1";
    product.agreedPrice = 12.5;
    product.volume = 100;
    product.subtotal = 1250;
    artifacts.products.push_back(product);
    artifacts.otherDimensions.push_back({"Lieferzeit", std::nullopt, "asap"});

    auto rows = toRecords(artifacts);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].getOr("kind", ""), "product");
    EXPECT_EQ(rows[0].getOr("subtotal", ""), "1250.00");
    EXPECT_EQ(rows[1].getOr("kind", ""), "other");
    EXPECT_EQ(rows[1].getOr("value", ""), "asap");
}

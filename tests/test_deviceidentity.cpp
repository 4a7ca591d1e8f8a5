/**
 * @file test_deviceidentity.cpp
 * @brief Tests for alias computation and canonical argument selection.
 */

#include <gtest/gtest.h>

#include "deviceidentity.hpp"
#include "testsupport.hpp"

using testsupport::makeDevice;

TEST(DeviceIdentity, AliasesCoverNameAddressesIdAndHostMetadata) {
  TailnetDevice device = makeDevice(QStringLiteral("n"), QStringLiteral("100.64.0.2"), QStringLiteral("d1"),
                                    QStringLiteral("h"));
  device.hostInfo.insert(QStringLiteral("DNSName"), QStringLiteral("d"));

  const QSet<QString> expected {
      QStringLiteral("n"), QStringLiteral("100.64.0.2"), QStringLiteral("d1"), QStringLiteral("h"), QStringLiteral("d")};
  EXPECT_EQ(DeviceIdentity::aliasesFor(device), expected);
}

TEST(DeviceIdentity, PreferredArgumentPriority) {
  EXPECT_EQ(DeviceIdentity::preferredArgument(
                makeDevice(QStringLiteral("alias"), QString(), QString(), QStringLiteral("exit-host"))),
            std::optional<QString>(QStringLiteral("exit-host")));

  TailnetDevice dnsOnly = makeDevice(QStringLiteral("alias"), QStringLiteral("100.64.0.5"), QStringLiteral("id5"));
  dnsOnly.hostInfo.insert(QStringLiteral("DNSName"), QStringLiteral("box.tail.ts.net"));
  EXPECT_EQ(DeviceIdentity::preferredArgument(dnsOnly), std::optional<QString>(QStringLiteral("box.tail.ts.net")));

  EXPECT_EQ(DeviceIdentity::preferredArgument(
                makeDevice(QStringLiteral("alias"), QStringLiteral("100.64.0.5"), QStringLiteral("id5"))),
            std::optional<QString>(QStringLiteral("alias")));
  EXPECT_EQ(DeviceIdentity::preferredArgument(makeDevice(QString(), QStringLiteral("100.64.0.5"), QStringLiteral("id5"))),
            std::optional<QString>(QStringLiteral("100.64.0.5")));
  EXPECT_EQ(DeviceIdentity::preferredArgument(makeDevice(QString(), QString(), QStringLiteral("id5"))),
            std::optional<QString>(QStringLiteral("id5")));
  EXPECT_FALSE(DeviceIdentity::preferredArgument(TailnetDevice {}).has_value());
}

TEST(DeviceIdentity, AliasMapFirstWriterWins) {
  const QList<TailnetDevice> devices {
      makeDevice(QStringLiteral("shared"), QStringLiteral("100.64.0.2"), QStringLiteral("a"), QStringLiteral("a-host"), true),
      makeDevice(QStringLiteral("shared"), QStringLiteral("100.64.0.3"), QStringLiteral("b"), QStringLiteral("b-host"), true),
  };

  const AliasMap map = DeviceIdentity::buildAliasMap(devices);
  EXPECT_EQ(map.value(QStringLiteral("shared")), QStringLiteral("a-host"));
  EXPECT_EQ(map.value(QStringLiteral("100.64.0.3")), QStringLiteral("b-host"));
  EXPECT_EQ(map.value(QStringLiteral("b")), QStringLiteral("b-host"));
  EXPECT_EQ(map.value(QStringLiteral("a-host")), QStringLiteral("a-host"));
}

TEST(DeviceIdentity, ResolveArgumentBridgesNamingDifferences) {
  const TailnetDevice eligible = makeDevice(QStringLiteral("exit-host"), QStringLiteral("100.64.0.2"),
                                            QStringLiteral("n1"), QStringLiteral("exit-host"), true);
  const AliasMap map = DeviceIdentity::buildAliasMap({eligible});

  // Same node, reported without host metadata and under another name.
  const TailnetDevice active = makeDevice(QStringLiteral("exit"), QString(), QStringLiteral("n1"));
  EXPECT_EQ(DeviceIdentity::resolveArgument(map, active), std::optional<QString>(QStringLiteral("exit-host")));

  const TailnetDevice unknown = makeDevice(QStringLiteral("other"), QString(), QStringLiteral("zz"));
  EXPECT_EQ(DeviceIdentity::resolveArgument(map, unknown), std::optional<QString>(QStringLiteral("other")));
}

TEST(DeviceIdentity, AliasesOfArgumentIncludesArgumentItself) {
  const TailnetDevice eligible = makeDevice(QStringLiteral("exit"), QStringLiteral("100.64.0.2"),
                                            QStringLiteral("n1"), QStringLiteral("exit-host"), true);
  const AliasMap map = DeviceIdentity::buildAliasMap({eligible});

  const QSet<QString> aliases = DeviceIdentity::aliasesOfArgument(map, QStringLiteral("exit-host"));
  EXPECT_TRUE(aliases.contains(QStringLiteral("exit-host")));
  EXPECT_TRUE(aliases.contains(QStringLiteral("exit")));
  EXPECT_TRUE(aliases.contains(QStringLiteral("100.64.0.2")));
  EXPECT_TRUE(aliases.contains(QStringLiteral("n1")));

  EXPECT_EQ(DeviceIdentity::aliasesOfArgument(map, QStringLiteral("ghost")), QSet<QString> {QStringLiteral("ghost")});
}

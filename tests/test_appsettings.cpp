/**
 * @file test_appsettings.cpp
 * @brief Tests for settings defaults and persistence.
 */

#include <gtest/gtest.h>

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include "appsettings.hpp"

TEST(AppSettings, DefaultsWhenStoreIsEmpty) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  QSettings store(QDir(dir.path()).filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

  const AppSettings settings = AppSettings::load(store);
  EXPECT_EQ(settings.tailscaleExecutable, QStringLiteral("tailscale"));
  EXPECT_TRUE(settings.upArguments.isEmpty());
  EXPECT_TRUE(settings.allowSudo);
  EXPECT_EQ(settings.refreshIntervalMs, 5000);
  EXPECT_TRUE(settings.loggingEnabled);
  EXPECT_TRUE(settings.lastExitNode.isEmpty());
  EXPECT_TRUE(settings.publicIpEnabled);
  EXPECT_EQ(settings.publicIpTtlSec, 180);
}

TEST(AppSettings, SaveThenLoadKeepsValues) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  const QString path = QDir(dir.path()).filePath(QStringLiteral("tailcontrol.ini"));

  AppSettings written;
  written.tailscaleExecutable = QStringLiteral("/opt/tailscale/bin/tailscale");
  written.upArguments = {QStringLiteral("--accept-dns=false"), QStringLiteral("--ssh")};
  written.allowSudo = false;
  written.refreshIntervalMs = 8000;
  written.loggingEnabled = false;
  written.lastExitNode = QStringLiteral("exit-host");
  written.publicIpEnabled = false;
  written.publicIpTtlSec = 60;
  {
    QSettings store(path, QSettings::IniFormat);
    written.save(store);
  }

  QSettings store(path, QSettings::IniFormat);
  const AppSettings read = AppSettings::load(store);
  EXPECT_EQ(read.tailscaleExecutable, written.tailscaleExecutable);
  EXPECT_EQ(read.upArguments, written.upArguments);
  EXPECT_FALSE(read.allowSudo);
  EXPECT_EQ(read.refreshIntervalMs, 8000);
  EXPECT_FALSE(read.loggingEnabled);
  EXPECT_EQ(read.lastExitNode, QStringLiteral("exit-host"));
  EXPECT_FALSE(read.publicIpEnabled);
  EXPECT_EQ(read.publicIpTtlSec, 60);
}

TEST(AppSettings, InvalidRefreshIntervalFallsBackToDefault) {
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  QSettings store(QDir(dir.path()).filePath(QStringLiteral("bad.ini")), QSettings::IniFormat);
  store.setValue(QStringLiteral("refresh/intervalMs"), 0);
  store.setValue(QStringLiteral("tailscale/executable"), QStringLiteral("   "));

  const AppSettings settings = AppSettings::load(store);
  EXPECT_EQ(settings.refreshIntervalMs, 5000);
  EXPECT_EQ(settings.tailscaleExecutable, QStringLiteral("tailscale"));
}

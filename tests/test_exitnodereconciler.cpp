/**
 * @file test_exitnodereconciler.cpp
 * @brief Tests for pending exit-node intents and their confirmation.
 */

#include <gtest/gtest.h>

#include "exitnodereconciler.hpp"
#include "testsupport.hpp"

using testsupport::makeDevice;
using testsupport::makeStatus;

namespace {

/// Records submitted commands; the test decides when they complete.
struct RecordingSubmitter {
  struct Call {
    std::optional<QString> argument;
    std::function<void()> onSuccess;
    std::function<void(const QString&)> onFailure;
  };

  QList<Call> calls;

  ExitNodeReconciler::CommandSubmitter submitter()
  {
    return [this](const std::optional<QString>& argument,
                  std::function<void()> onSuccess,
                  std::function<void(const QString&)> onFailure) {
      calls.append(Call {argument, std::move(onSuccess), std::move(onFailure)});
    };
  }
};

TailnetDevice exitHost()
{
  return makeDevice(QStringLiteral("exit-host"), QStringLiteral("100.64.0.2"), QStringLiteral("n1"),
                    QStringLiteral("exit-host"), true);
}

TailnetDevice backupHost()
{
  return makeDevice(QStringLiteral("backup"), QStringLiteral("100.64.0.3"), QStringLiteral("n2"),
                    QStringLiteral("backup-host"), true);
}

TailnetStatus snapshot(const QList<TailnetDevice>& eligible, const std::optional<TailnetDevice>& active)
{
  TailnetStatus status = makeStatus(QStringLiteral("Running"), true);
  for (TailnetDevice device : eligible) {
    device.activeExitNode = active.has_value() && device.id == active->id;
    status.devices.append(device);
    status.exitNodes.append(device);
  }
  if (active.has_value()) {
    status.activeExitNode = active;
    status.activeExitNode->activeExitNode = true;
  }
  return status;
}

} // namespace

TEST(ExitNodeReconciler, RequestDispatchesAndShowsIntentImmediately) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost()}, std::nullopt));
  EXPECT_FALSE(reconciler.displayedEnabled());

  QString error;
  ASSERT_TRUE(reconciler.request(true, QStringLiteral("exit-host"), &error)) << error.toStdString();
  ASSERT_EQ(recorder.calls.size(), 1);
  EXPECT_EQ(recorder.calls.first().argument, std::optional<QString>(QStringLiteral("exit-host")));
  EXPECT_TRUE(reconciler.busy());
  EXPECT_TRUE(reconciler.displayedEnabled());
  EXPECT_EQ(reconciler.displayedTarget(), std::optional<QString>(QStringLiteral("exit-host")));
}

TEST(ExitNodeReconciler, IntentSurvivesCommandSuccessUntilSnapshotConfirms) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost()}, std::nullopt));

  bool succeeded = false;
  QObject::connect(&reconciler, &ExitNodeReconciler::commandSucceeded, [&](bool enabled, const QString& target) {
    succeeded = enabled && target == QStringLiteral("exit-host");
  });

  ASSERT_TRUE(reconciler.request(true, std::nullopt));
  recorder.calls.first().onSuccess();
  EXPECT_TRUE(succeeded);
  EXPECT_FALSE(reconciler.busy());
  ASSERT_TRUE(reconciler.pendingIntent().has_value());
  EXPECT_EQ(reconciler.lastAppliedTarget(), QStringLiteral("exit-host"));

  // The daemon has not applied it yet: the toggle keeps showing the intent.
  reconciler.reconcile(snapshot({exitHost()}, std::nullopt));
  EXPECT_TRUE(reconciler.pendingIntent().has_value());
  EXPECT_TRUE(reconciler.displayedEnabled());

  reconciler.reconcile(snapshot({exitHost()}, exitHost()));
  EXPECT_FALSE(reconciler.pendingIntent().has_value());
  EXPECT_TRUE(reconciler.displayedEnabled());
  EXPECT_EQ(reconciler.activeArgument(), std::optional<QString>(QStringLiteral("exit-host")));
}

TEST(ExitNodeReconciler, SatisfiedThroughAliasWhenPreferredArgumentDiffers) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());

  ASSERT_TRUE(reconciler.request(true, QStringLiteral("exit-host")));
  recorder.calls.first().onSuccess();

  // Same node now advertises another hostname; its name still matches.
  const TailnetDevice renamed = makeDevice(QStringLiteral("exit-host"), QStringLiteral("100.64.0.2"),
                                           QStringLiteral("n1"), QStringLiteral("renamed-host"), true);
  reconciler.reconcile(snapshot({renamed}, renamed));

  EXPECT_EQ(reconciler.activeArgument(), std::optional<QString>(QStringLiteral("renamed-host")));
  EXPECT_FALSE(reconciler.pendingIntent().has_value());
}

TEST(ExitNodeReconciler, SatisfiedIntentIsKeptWhileCommandInFlight) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost()}, std::nullopt));

  ASSERT_TRUE(reconciler.request(true, QStringLiteral("exit-host")));
  reconciler.reconcile(snapshot({exitHost()}, exitHost()));
  EXPECT_TRUE(reconciler.intentSatisfied());
  EXPECT_TRUE(reconciler.pendingIntent().has_value());

  recorder.calls.first().onSuccess();
  reconciler.reconcile(snapshot({exitHost()}, exitHost()));
  EXPECT_FALSE(reconciler.pendingIntent().has_value());
}

TEST(ExitNodeReconciler, DisableIsSatisfiedWhenNoEgressIsActive) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost()}, exitHost()));
  EXPECT_TRUE(reconciler.displayedEnabled());

  ASSERT_TRUE(reconciler.request(false, std::nullopt));
  EXPECT_FALSE(recorder.calls.first().argument.has_value());
  EXPECT_FALSE(reconciler.displayedEnabled());
  recorder.calls.first().onSuccess();

  reconciler.reconcile(snapshot({exitHost()}, exitHost()));
  EXPECT_FALSE(reconciler.displayedEnabled());

  reconciler.reconcile(snapshot({exitHost()}, std::nullopt));
  EXPECT_FALSE(reconciler.pendingIntent().has_value());
  EXPECT_FALSE(reconciler.displayedEnabled());
}

TEST(ExitNodeReconciler, FailureDiscardsIntentAndRevertsDisplay) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost()}, std::nullopt));

  QString reported;
  QObject::connect(&reconciler, &ExitNodeReconciler::commandFailed, [&](const QString& error) { reported = error; });

  ASSERT_TRUE(reconciler.request(true, QStringLiteral("exit-host")));
  recorder.calls.first().onFailure(QStringLiteral("Failed to set exit node: access denied"));

  EXPECT_EQ(reported, QStringLiteral("Failed to set exit node: access denied"));
  EXPECT_FALSE(reconciler.pendingIntent().has_value());
  EXPECT_FALSE(reconciler.busy());
  EXPECT_FALSE(reconciler.displayedEnabled());
  EXPECT_TRUE(reconciler.lastAppliedTarget().isEmpty());
}

TEST(ExitNodeReconciler, RefusesSecondRequestWhileBusy) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost(), backupHost()}, std::nullopt));

  ASSERT_TRUE(reconciler.request(true, QStringLiteral("exit-host")));
  QString error;
  EXPECT_FALSE(reconciler.request(true, QStringLiteral("backup-host"), &error));
  EXPECT_FALSE(error.isEmpty());
  EXPECT_EQ(recorder.calls.size(), 1);
}

TEST(ExitNodeReconciler, FallbackPrefersLastAppliedTargetThenFirstEligible) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({exitHost(), backupHost()}, std::nullopt));

  reconciler.setLastAppliedTarget(QStringLiteral("backup-host"));
  EXPECT_EQ(reconciler.chooseTarget(std::nullopt), std::optional<QString>(QStringLiteral("backup-host")));

  reconciler.setLastAppliedTarget(QStringLiteral("gone-host"));
  EXPECT_EQ(reconciler.chooseTarget(std::nullopt), std::optional<QString>(QStringLiteral("exit-host")));

  // Explicit choices are mapped to the canonical argument.
  EXPECT_EQ(reconciler.chooseTarget(QStringLiteral("100.64.0.3")), std::optional<QString>(QStringLiteral("backup-host")));
}

TEST(ExitNodeReconciler, EnableWithoutEligibleDevicesIsRefused) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  reconciler.reconcile(snapshot({}, std::nullopt));

  EXPECT_FALSE(reconciler.chooseTarget(std::nullopt).has_value());
  QString error;
  EXPECT_FALSE(reconciler.request(true, std::nullopt, &error));
  EXPECT_EQ(error, QStringLiteral("No exit nodes available."));
  EXPECT_TRUE(recorder.calls.isEmpty());
  EXPECT_FALSE(reconciler.pendingIntent().has_value());
}

TEST(ExitNodeReconciler, OptionsMarkTheActiveDevice) {
  RecordingSubmitter recorder;
  ExitNodeReconciler reconciler(recorder.submitter());
  TailnetDevice offline = backupHost();
  offline.online = false;
  reconciler.reconcile(snapshot({exitHost(), offline}, exitHost()));

  const QList<ExitNodeOption> options = reconciler.options();
  ASSERT_EQ(options.size(), 2);
  EXPECT_EQ(options.at(0).argument, QStringLiteral("exit-host"));
  EXPECT_TRUE(options.at(0).active);
  EXPECT_EQ(options.at(1).argument, QStringLiteral("backup-host"));
  EXPECT_FALSE(options.at(1).active);
  EXPECT_FALSE(options.at(1).online);
}

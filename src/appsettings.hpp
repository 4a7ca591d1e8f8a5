/*!
 * @file        appsettings.hpp
 * @brief       Persistent user configuration.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_APPSETTINGS_HPP
#define TAILCONTROL_APPSETTINGS_HPP

#include <QString>
#include <QStringList>

class QSettings;

/**
 * @struct AppSettings
 * @brief Values stored under the application's QSettings scope.
 */
struct AppSettings {
    QString tailscaleExecutable = QStringLiteral("tailscale"); //!< Name or absolute path.
    QStringList upArguments;                                   //!< Extra `up` arguments.
    bool allowSudo = true;                                     //!< Retry egress changes via sudo.
    int refreshIntervalMs = 5000;                              //!< Periodic refresh.
    bool loggingEnabled = true;                                //!< Collect diagnostic lines.
    QString lastExitNode;                                      //!< Last applied egress argument.
    bool publicIpEnabled = true;                               //!< Look up the public IP.
    int publicIpTtlSec = 180;                                  //!< Public IP cache lifetime.

    /**
     * @brief Load from the default application settings.
     * @return Stored values, defaults for missing keys.
     */
    static AppSettings load();

    /**
     * @brief Load from an explicit settings store.
     * @param settings Store to read.
     * @return Stored values, defaults for missing keys.
     */
    static AppSettings load(QSettings& settings);

    //! Save to the default application settings.
    void save() const;

    /**
     * @brief Save to an explicit settings store.
     * @param settings Store to write.
     */
    void save(QSettings& settings) const;
};

#endif // TAILCONTROL_APPSETTINGS_HPP

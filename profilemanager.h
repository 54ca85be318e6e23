#ifndef PROFILEMANAGER_H
#define PROFILEMANAGER_H

#include <QColor>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include "types.h"

class ConfigRepository;
class Settings;

// Maps profile labels to their CSV files and persists the per-profile goal
// and color overrides. Labels compare case-insensitively everywhere.
class ProfileManager
{
private:
	ConfigRepository& repo_;
	const Settings& settings_;
	QString data_dir_;
	QStringList custom_profiles_;
	QString active_profile_;

	QStringList loadCustomProfiles() const;
	QString loadActiveProfile() const;
	int readIntSetting(const QString& key, int fallback) const;
	qint64 legacyGoalSeconds() const;
	static QString goalSettingsBase(const QString& label);
	static QString colorKey(const QString& label);
	QColor storedColor(const QString& label) const;
	bool fileNameTaken(const QString& file_name) const;

public:
	ProfileManager(ConfigRepository& repo, const Settings& settings, const QString& data_dir);

	static QList<QPair<QString, QString>> builtInProfiles();
	static QString defaultProfile();
	static QStringList colorPalette();
	static QString normalizeLabel(const QString& label);
	static bool isReserved(const QString& label);
	static QString errorMessage(ProfileError error);

	QStringList labels() const;
	const QStringList& customLabels() const;
	bool isBuiltIn(const QString& label) const;
	bool exists(const QString& label) const;
	QString canonicalLabel(const QString& label) const;
	const QString& dataDir() const;
	QString fileName(const QString& label) const;
	QString filePath(const QString& label) const;

	ProfileError validateLabel(const QString& label) const;
	ProfileError addProfile(const QString& label, qint64 initial_goal_seconds);
	ProfileError deleteProfile(const QString& label);
	const QString& activeProfile() const;
	ProfileError switchTo(const QString& label);
	void save();

	qint64 goalSeconds(const QString& label);
	void setGoalSeconds(const QString& label, qint64 seconds);
	void clearGoal(const QString& label);

	QColor profileColor(const QString& label) const;
	bool hasColorOverride(const QString& label) const;
	static QColor paletteColor(const QString& label);
	ProfileError setProfileColor(const QString& label, const QColor& color);
	void clearProfileColor(const QString& label);
};

#endif // PROFILEMANAGER_H

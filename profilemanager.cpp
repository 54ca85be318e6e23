#include "profilemanager.h"
#include <QDir>
#include <QFile>
#include <QSet>
#include <algorithm>
#include "configrepository.h"
#include "helpers.h"
#include "logger.h"
#include "settings.h"

ProfileManager::ProfileManager(ConfigRepository& repo, const Settings& settings, const QString& data_dir)
	: repo_(repo), settings_(settings), data_dir_(data_dir)
{
	custom_profiles_ = loadCustomProfiles();
	active_profile_ = loadActiveProfile();
}

QList<QPair<QString, QString>> ProfileManager::builtInProfiles()
{
	return {
		qMakePair(QString("Activate Immersion"), QString("active.csv")),
		qMakePair(QString("Passive Immersion"), QString("passive.csv")),
		qMakePair(QString("Phonetic Training"), QString("phonetic.csv")),
		qMakePair(QString("Output"), QString("output.csv")),
		qMakePair(QString("Soroban"), QString("soroban.csv")),
		qMakePair(QString("Anki/Migaku"), QString("anki.csv")),
	};
}

QString ProfileManager::defaultProfile()
{
	return QStringLiteral("Activate Immersion");
}

QStringList ProfileManager::colorPalette()
{
	return { "#38bdf8", "#f472b6", "#22c55e", "#f59e0b", "#ef4444", "#a855f7", "#14b8a6", "#eab308" };
}

QString ProfileManager::normalizeLabel(const QString& label)
{
	QString clean = label.trimmed();
	if (clean.endsWith(".csv", Qt::CaseInsensitive))
		clean = clean.left(clean.size() - 4).trimmed();
	return clean;
}

bool ProfileManager::isReserved(const QString& label)
{
	const QString key = label.trimmed().toLower();
	return key == QLatin1String("add profile") || key == QLatin1String("delete profile");
}

QString ProfileManager::errorMessage(ProfileError error)
{
	switch (error) {
	case ProfileError::None: return QString();
	case ProfileError::EmptyLabel: return QStringLiteral("Profile name cannot be empty");
	case ProfileError::PathSeparator: return QStringLiteral("Profile name cannot include path separators");
	case ProfileError::ReservedLabel: return QStringLiteral("Profile name is reserved");
	case ProfileError::DuplicateLabel: return QStringLiteral("Profile already exists");
	case ProfileError::FileNameTaken: return QStringLiteral("Profile name clashes with the log file of another profile");
	case ProfileError::UnknownProfile: return QStringLiteral("Profile does not exist");
	case ProfileError::BuiltInProfile: return QStringLiteral("Built-in profiles cannot be deleted");
	case ProfileError::InvalidColor: return QStringLiteral("Invalid color");
	}
	return QString();
}

QStringList ProfileManager::loadCustomProfiles() const
{
	QStringList raw;
	const QVariant value = repo_.value("profiles/custom", QStringList());
	if (value.type() == QVariant::String)
		raw = value.toString().split('|');
	else
		raw = value.toStringList();

	QStringList labels;
	QSet<QString> seen;
	QSet<QString> files;
	for (const auto& p : builtInProfiles())
		files.insert(p.second.toLower());
	for (const auto& item : raw) {
		const QString label = item.trimmed();
		if (label.isEmpty() || isReserved(label) || isBuiltIn(label))
			continue;
		const QString key = label.toLower();
		const QString file = (normalizeLabel(label) + ".csv").toLower();
		// a label whose file belongs to another profile is never loaded
		if (seen.contains(key) || files.contains(file))
			continue;
		seen.insert(key);
		files.insert(file);
		labels << label;
	}
	return labels;
}

QString ProfileManager::loadActiveProfile() const
{
	const QString active = repo_.value("profiles/active", defaultProfile()).toString().trimmed();
	if (active.isEmpty() || !labels().contains(active))
		return defaultProfile();
	return active;
}

void ProfileManager::save()
{
	repo_.setValue("profiles/active", active_profile_);
	repo_.setValue("profiles/custom", custom_profiles_);
	repo_.sync();
}

QStringList ProfileManager::labels() const
{
	QStringList all;
	for (const auto& p : builtInProfiles())
		all << p.first;
	all << custom_profiles_;
	return all;
}

const QStringList& ProfileManager::customLabels() const
{
	return custom_profiles_;
}

bool ProfileManager::isBuiltIn(const QString& label) const
{
	const QString key = label.trimmed();
	for (const auto& p : builtInProfiles()) {
		if (p.first.compare(key, Qt::CaseInsensitive) == 0)
			return true;
	}
	return false;
}

bool ProfileManager::exists(const QString& label) const
{
	return !canonicalLabel(label).isEmpty();
}

QString ProfileManager::canonicalLabel(const QString& label) const
{
	const QString key = label.trimmed();
	for (const auto& existing : labels()) {
		if (existing.compare(key, Qt::CaseInsensitive) == 0)
			return existing;
	}
	return QString();
}

const QString& ProfileManager::dataDir() const
{
	return data_dir_;
}

QString ProfileManager::fileName(const QString& label) const
{
	for (const auto& p : builtInProfiles()) {
		if (p.first == label)
			return p.second;
	}
	return normalizeLabel(label) + ".csv";
}

QString ProfileManager::filePath(const QString& label) const
{
	return QDir(data_dir_).filePath(fileName(label));
}

ProfileError ProfileManager::validateLabel(const QString& label) const
{
	const QString clean = normalizeLabel(label);
	if (clean.isEmpty())
		return ProfileError::EmptyLabel;
	if (clean.contains('/') || clean.contains('\\') || clean.contains(':'))
		return ProfileError::PathSeparator;
	if (isReserved(clean))
		return ProfileError::ReservedLabel;
	if (exists(clean))
		return ProfileError::DuplicateLabel;
	if (fileNameTaken(fileName(clean)))
		return ProfileError::FileNameTaken;
	return ProfileError::None;
}

bool ProfileManager::fileNameTaken(const QString& file_name) const
{
	// file names compare case-insensitively so no two profiles share a log
	for (const auto& existing : labels()) {
		if (fileName(existing).compare(file_name, Qt::CaseInsensitive) == 0)
			return true;
	}
	return false;
}

ProfileError ProfileManager::addProfile(const QString& label, qint64 initial_goal_seconds)
{
	const ProfileError error = validateLabel(label);
	if (error != ProfileError::None) {
		if (settings_.logToFile())
			Logger::Log("[PROFILE] Rejected profile '" + label + "': " + errorMessage(error));
		return error;
	}

	const QString clean = normalizeLabel(label);
	custom_profiles_ << clean;
	setGoalSeconds(clean, initial_goal_seconds);
	save();
	if (settings_.logToFile())
		Logger::Log("[PROFILE] Added profile " + clean);
	return ProfileError::None;
}

ProfileError ProfileManager::deleteProfile(const QString& label)
{
	if (isBuiltIn(label))
		return ProfileError::BuiltInProfile;
	const QString existing = canonicalLabel(label);
	if (existing.isEmpty())
		return ProfileError::UnknownProfile;

	const QString path = filePath(existing);
	custom_profiles_.removeAll(existing);
	if (QFile::exists(path) && !QFile::remove(path))
		Logger::Warn("[PROFILE] Failed to delete profile file " + path, settings_.logToFile());
	clearProfileColor(existing);
	clearGoal(existing);
	if (active_profile_ == existing)
		active_profile_ = defaultProfile();
	save();
	if (settings_.logToFile())
		Logger::Log("[PROFILE] Deleted profile " + existing);
	return ProfileError::None;
}

const QString& ProfileManager::activeProfile() const
{
	return active_profile_;
}

ProfileError ProfileManager::switchTo(const QString& label)
{
	const QString existing = canonicalLabel(label);
	if (existing.isEmpty())
		return ProfileError::UnknownProfile;
	active_profile_ = existing;
	save();
	return ProfileError::None;
}

int ProfileManager::readIntSetting(const QString& key, int fallback) const
{
	bool ok = false;
	const int value = repo_.value(key, fallback).toInt(&ok);
	return ok ? value : fallback;
}

qint64 ProfileManager::legacyGoalSeconds() const
{
	return convHmToSec(readIntSetting("super_goal/hours", 2), readIntSetting("super_goal/minutes", 0));
}

QString ProfileManager::goalSettingsBase(const QString& label)
{
	QString clean = label.trimmed().toLower();
	if (clean.isEmpty())
		clean = QStringLiteral("default");
	clean.replace('/', '_').replace('\\', '_').replace(':', '_');
	return "super_goal/profiles/" + clean;
}

qint64 ProfileManager::goalSeconds(const QString& label)
{
	const QString base = goalSettingsBase(label);
	if (repo_.contains(base + "/hours") || repo_.contains(base + "/minutes"))
		return convHmToSec(readIntSetting(base + "/hours", 0), readIntSetting(base + "/minutes", 0));

	// first read of a profile inherits the old global goal
	const qint64 legacy = legacyGoalSeconds();
	setGoalSeconds(label, legacy);
	return legacy;
}

void ProfileManager::setGoalSeconds(const QString& label, qint64 seconds)
{
	const qint64 total = std::max<qint64>(0, seconds);
	const QString base = goalSettingsBase(label);
	repo_.setValue(base + "/hours", static_cast<int>(total / 3600));
	repo_.setValue(base + "/minutes", static_cast<int>((total % 3600) / 60));
	repo_.sync();
}

void ProfileManager::clearGoal(const QString& label)
{
	repo_.remove(goalSettingsBase(label));
	repo_.sync();
}

QString ProfileManager::colorKey(const QString& label)
{
	return "profiles/colors/" + label.trimmed().toLower();
}

QColor ProfileManager::paletteColor(const QString& label)
{
	const QStringList palette = colorPalette();
	int seed = 0;
	for (const QChar c : label.trimmed().toLower())
		seed += c.unicode();
	return QColor(palette.at(seed % palette.size()));
}

QColor ProfileManager::storedColor(const QString& label) const
{
	const QString name = repo_.value(colorKey(label), QString()).toString();
	if (!QColor::isValidColor(name))
		return QColor();
	return QColor(name);
}

bool ProfileManager::hasColorOverride(const QString& label) const
{
	return storedColor(label).isValid();
}

QColor ProfileManager::profileColor(const QString& label) const
{
	const QColor color = storedColor(label);
	if (color.isValid())
		return color;
	return paletteColor(label);
}

ProfileError ProfileManager::setProfileColor(const QString& label, const QColor& color)
{
	const QString existing = canonicalLabel(label);
	if (existing.isEmpty())
		return ProfileError::UnknownProfile;
	if (!color.isValid())
		return ProfileError::InvalidColor;
	repo_.setValue(colorKey(existing), color.name());
	repo_.sync();
	return ProfileError::None;
}

void ProfileManager::clearProfileColor(const QString& label)
{
	repo_.remove(colorKey(label));
	repo_.sync();
}

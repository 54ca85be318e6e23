#ifndef CONFIGREPOSITORY_H
#define CONFIGREPOSITORY_H

#include <QString>
#include <QVariant>
#include <QSettings>

// Key-value store the engine persists its profile and totals settings into.
class ConfigRepository
{
public:
	virtual ~ConfigRepository() = default;
	virtual QVariant value(const QString &key, const QVariant &fallback = QVariant()) const = 0;
	virtual void setValue(const QString &key, const QVariant &value) = 0;
	virtual void remove(const QString &key) = 0;
	virtual bool contains(const QString &key) const = 0;
	virtual void sync() = 0;
};

class IniConfigRepository : public ConfigRepository
{
private:
	QSettings sfile_;

public:
	explicit IniConfigRepository(const QString &filename);

	QVariant value(const QString &key, const QVariant &fallback = QVariant()) const override;
	void setValue(const QString &key, const QVariant &value) override;
	void remove(const QString &key) override;
	bool contains(const QString &key) const override;
	void sync() override;
	QString fileName() const;
};

#endif // CONFIGREPOSITORY_H

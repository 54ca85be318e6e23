#include "configrepository.h"

IniConfigRepository::IniConfigRepository(const QString &filename) : sfile_(filename, QSettings::IniFormat)
{
	sfile_.setIniCodec("UTF-8");
}

QVariant IniConfigRepository::value(const QString &key, const QVariant &fallback) const
{
	return sfile_.value(key, fallback);
}

void IniConfigRepository::setValue(const QString &key, const QVariant &value)
{
	sfile_.setValue(key, value);
}

void IniConfigRepository::remove(const QString &key)
{
	sfile_.remove(key);
}

bool IniConfigRepository::contains(const QString &key) const
{
	return sfile_.contains(key);
}

void IniConfigRepository::sync()
{
	sfile_.sync();
}

QString IniConfigRepository::fileName() const
{
	return sfile_.fileName();
}

/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include "DspfReparser.h"
#include "DspfParser.h"
#include "DspfHelper.h"
#include <QSettings>
#include <QTimer>
#include <QtDebug>
using namespace Dspf;

Reparser::Reparser(QObject *parent) : QObject(parent),d_request(0)
{
    d_timer = new QTimer(this);
    d_timer->setSingleShot(true);
    d_timer->setInterval(DefaultDebounce);
    connect( d_timer, SIGNAL(timeout()), this, SLOT(onTimeout()) );
    d_suffixes << QLatin1String(".dspf");
}

void Reparser::loadSettings(QSettings& set)
{
    bool ok;
    const int ms = set.value("Reparse/Debounce", int(DefaultDebounce)).toInt(&ok);
    if( ok && ms >= 0 )
        setDebounce(ms);
    else
        qWarning() << "ignoring invalid Reparse/Debounce setting" << set.value("Reparse/Debounce");

    QStringList suffixes = set.value("Files/Suffixes").toStringList();
    suffixes.removeAll(QString());
    if( !suffixes.isEmpty() )
        d_suffixes = suffixes;
}

void Reparser::setDebounce(int ms)
{
    d_timer->setInterval(ms);
}

int Reparser::getDebounce() const
{
    return d_timer->interval();
}

bool Reparser::accepts(const QString& path) const
{
    return Helper::hasSuffix(path, d_suffixes);
}

bool Reparser::activate(const QString& path, const QString& text)
{
    d_timer->stop();
    d_path = path;
    if( !accepts(path) )
    {
        d_text.clear();
        d_doc.clear();
        d_request++;
        emit sigReparsed();
        return false;
    }
    d_text = text;
    reparse(++d_request);
    return true;
}

void Reparser::textChanged(const QString& path, const QString& text)
{
    if( !accepts(path) )
        return;
    d_path = path;
    d_text = text;
    d_request++;
    d_timer->start();
}

void Reparser::close()
{
    d_timer->stop();
    d_request++;
    d_path.clear();
    d_text.clear();
    d_doc.clear();
    emit sigReparsed();
}

bool Reparser::isPending() const
{
    return d_timer->isActive();
}

void Reparser::onTimeout()
{
    reparse(d_request);
}

void Reparser::reparse(quint32 request)
{
    const Document doc = Parser::parseDocument(d_text);
    if( request != d_request )
    {
        qDebug() << "discarding stale parse result" << request << "of" << d_path;
        return;
    }
    d_doc = doc;
    qDebug() << "reparsed" << d_path << doc.elements.size() << "elements" << doc.catalog.size() << "records";
    emit sigReparsed();
}

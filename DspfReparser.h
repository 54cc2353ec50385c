#ifndef DSPFREPARSER_H
#define DSPFREPARSER_H

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

#include <QObject>
#include <QStringList>
#include <DspfAst.h>

class QTimer;
class QSettings;

namespace Dspf
{
    class Reparser : public QObject
    {
        Q_OBJECT
    public:
        enum { DefaultDebounce = 150 };

        explicit Reparser(QObject *parent = 0);

        void loadSettings(QSettings&);
        void setDebounce(int ms);
        int getDebounce() const;
        void setSuffixes(const QStringList& s) { d_suffixes = s; }
        const QStringList& getSuffixes() const { return d_suffixes; }
        bool accepts(const QString& path) const;

        bool activate(const QString& path, const QString& text);
        void textChanged(const QString& path, const QString& text);
        void close();

        const Document& getDocument() const { return d_doc; }
        const QString& getPath() const { return d_path; }
        bool isPending() const;
        quint32 getRequest() const { return d_request; }
    signals:
        void sigReparsed();
    protected slots:
        void onTimeout();
    protected:
        void reparse(quint32 request);
    private:
        QTimer* d_timer;
        Document d_doc;
        QString d_path;
        QString d_text;
        QStringList d_suffixes;
        quint32 d_request;
    };
}

#endif // DSPFREPARSER_H

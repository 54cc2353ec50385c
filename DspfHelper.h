#ifndef DSPFHELPER_H
#define DSPFHELPER_H

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

#include <DspfAst.h>

namespace Dspf
{
    class Helper
    {
    public:
        struct Overlap
        {
            QString first;
            QString second;
            bool firstIsField;
            bool secondIsField;
            quint16 row;
            Overlap():firstIsField(false),secondIsField(false),row(0) {}
        };

        static QString describe(const Element&);
        static QString describeField(const Element&);
        static QString describeConstant(const Element&);
        static QString describeSize(const Size&);
        static QString formatIndicators(const Indicators&);
        static QString formatIndicator(const Indicator&);
        static QString formatAttributes(const Attributes&);

        // fields and constants of the record on the same row with intersecting columns
        static QList<Overlap> findOverlaps(const RecordEntry&);

        static bool recordExists(const Catalog&, const QString& name);
        static bool hasSuffix(const QString& path, const QStringList& suffixes);
    };
}

#endif // DSPFHELPER_H

#ifndef DSPFLINKER_H
#define DSPFLINKER_H

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
    class Linker
    {
    public:
        // attaches keyword lines to their owners, fields and constants to their records,
        // and removes the AttrLine elements from the list
        static void link(Document&);

        // endLineIndex of each record is the line before the next record or the last line
        static void assignEndLines(Document&);

        static bool hasKeyword(const Element& owner, const QString& keyword);
        // keyword names of a merged keyword text, e.g. "SFLCTL(SFLREC) TEXT('x')" gives SFLCTL, TEXT
        static QStringList keywordNames(const QString& text);
    protected:
        static void attachAttributes(ElementList&);
        static void attachToRecords(Document&);
        static void syncRecords(Document&);
        static void dropAttrLines(ElementList&);
        static FieldInfo toFieldInfo(const Element&);
        static ConstantInfo toConstantInfo(const Element&);
    };
}

#endif // DSPFLINKER_H

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

#include "DspfScreenSize.h"
#include <QRegularExpression>
using namespace Dspf;

void ScreenSize::resolve(Document& doc)
{
    doc.defaultSize = standard();
    doc.alternateSize = Size();
    if( !doc.elements.isEmpty() && doc.elements.first().kind == Element::FileDecl )
    {
        static const QRegularExpression kw("\\bDSPSIZ\\s*\\(", QRegularExpression::CaseInsensitiveOption);
        foreach( const Attribute& a, doc.elements.first().attributes )
        {
            if( !kw.match(a.text).hasMatch() )
                continue;
            Size primary, secondary;
            if( parseDisplaySize(a.text, &primary, &secondary) )
            {
                doc.defaultSize = primary;
                doc.alternateSize = secondary;
            }
            break; // a malformed DSPSIZ falls back to the standard size
        }
    }

    for( int i = 0; i < doc.elements.size(); i++ )
    {
        Element& rec = doc.elements[i];
        if( rec.kind != Element::RecordDecl )
            continue;
        rec.size = doc.defaultSize;
        foreach( const Attribute& a, rec.attributes )
        {
            Size w;
            if( parseWindow(a.text, &w) )
            {
                rec.size = w;
                break;
            }
        }
        RecordEntry* entry = doc.findRecord(rec.name);
        if( entry && entry->startLine == rec.lineIndex )
            entry->size = rec.size;
    }
}

bool ScreenSize::parseDisplaySize(const QString& keyword, Size* primary, Size* secondary)
{
    static const QRegularExpression kw("DSPSIZ\\s*\\(([^)]*)\\)", QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression triplet("(\\d+)\\s+(\\d+)(?:\\s+(\\*[A-Za-z0-9]+))?|(\\*[A-Za-z0-9]+)");

    const QRegularExpressionMatch m = kw.match(keyword);
    if( !m.hasMatch() )
        return false;

    QList<Size> sizes;
    QRegularExpressionMatchIterator i = triplet.globalMatch(m.captured(1));
    while( i.hasNext() )
    {
        const QRegularExpressionMatch t = i.next();
        if( !t.captured(4).isEmpty() )
        {
            const Size s = predefined(t.captured(4).toUpper());
            if( s.isValid() )
                sizes << s;
        }else
        {
            const Size s(t.captured(1).toUShort(), t.captured(2).toUShort(), t.captured(3).toUpper());
            if( s.isValid() )
                sizes << s;
        }
    }
    if( sizes.isEmpty() )
        return false;
    if( primary )
        *primary = sizes[0];
    if( secondary )
        *secondary = sizes.size() > 1 ? sizes[1] : Size();
    return true;
}

bool ScreenSize::parseWindow(const QString& keyword, Size* window)
{
    static const QRegularExpression kw("WINDOW\\s*\\(\\s*(\\d+)\\s+(\\d+)\\s+(\\d+)\\s+(\\d+)\\s*\\)",
                                       QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = kw.match(keyword);
    if( !m.hasMatch() )
        return false;
    Size s;
    s.originRow = m.captured(1).toUShort();
    s.originCol = m.captured(2).toUShort();
    s.rows = m.captured(3).toUShort();
    s.cols = m.captured(4).toUShort();
    s.source = Size::Window;
    s.label = QString("WINDOW_%1_%2_%3_%4").arg(s.originRow).arg(s.originCol).arg(s.rows).arg(s.cols);
    if( window )
        *window = s;
    return true;
}

Size ScreenSize::standard()
{
    return Size(24, 80, QLatin1String("*DS3"));
}

Size ScreenSize::predefined(const QString& label)
{
    if( label == QLatin1String("*DS3") )
        return Size(24, 80, label);
    if( label == QLatin1String("*DS4") )
        return Size(27, 132, label);
    return Size();
}

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

#include "DspfLineFormat.h"
#include <algorithm>
using namespace Dspf;

SourceLine::SourceLine(const QString& raw)
{
    if( raw.size() > LineFormat::SeqAreaLen )
        d_text = raw.mid(LineFormat::SeqAreaLen);
}

bool SourceLine::isComment() const
{
    return slice(0,2) == QLatin1String("A*");
}

QString SourceLine::slice(int from, int to) const
{
    // short lines degrade to empty or partial slices
    if( from >= d_text.size() || to <= from )
        return QString();
    return d_text.mid(from, to - from);
}

QChar SourceLine::at(int pos) const
{
    if( pos < 0 || pos >= d_text.size() )
        return QChar();
    return d_text[pos];
}

int SourceLine::toNumber(const QString& digits, bool* ok)
{
    bool valid = false;
    int res = 0;
    const QString str = digits.trimmed();
    if( !str.isEmpty() )
        res = str.toInt(&valid);
    if( !valid || res < 0 )
    {
        valid = false;
        res = 0;
    }
    if( ok )
        *ok = valid;
    return res;
}

QStringList LineFormatter::splitLines(const QString& text)
{
    QStringList lines = text.split(QLatin1Char('\n'));
    for( int i = 0; i < lines.size(); i++ )
    {
        if( lines[i].endsWith(QLatin1Char('\r')) )
            lines[i].chop(1);
    }
    return lines;
}

static bool IndicatorLessThan(const Indicator& lhs, const Indicator& rhs)
{
    return lhs.number < rhs.number;
}

Indicators LineFormatter::decodeIndicators(const QString& segment)
{
    Indicators res;
    for( int i = 0; i < 3; i++ )
    {
        const QString slot = segment.mid(i * 3, 3);
        const QString num = slot.mid(1).trimmed();
        if( num.isEmpty() )
            continue;
        bool ok;
        const int n = num.toInt(&ok);
        if( !ok || n < 1 || n > 99 )
            continue;
        res << Indicator(n, slot[0] == QLatin1Char('N'));
    }
    std::stable_sort( res.begin(), res.end(), IndicatorLessThan );
    return res;
}

LineFormatter::Merged LineFormatter::mergeConstant(const QStringList& lines, int start)
{
    if( start < 0 || start >= lines.size() )
        return Merged();
    QString buf;
    int cur = start;
    while( true )
    {
        const SourceLine line(lines[cur]);
        const QString piece = line.literalArea();
        if( !line.continues() )
        {
            buf += piece;
            break;
        }
        buf += piece.left(LineFormat::ContinuationPos - LineFormat::KeywordPos);
        if( cur + 1 >= lines.size() )
            break;
        cur++;
    }
    return Merged(buf.trimmed(), cur);
}

LineFormatter::Merged LineFormatter::mergeKeywords(const QStringList& lines, int start)
{
    if( start < 0 || start >= lines.size() )
        return Merged();
    QString buf;
    int cur = start;
    while( true )
    {
        const QString part = SourceLine(lines[cur]).keywordArea();
        int n = part.size();
        while( n > 0 && part[n-1].isSpace() )
            n--;
        if( n == 0 || part[n-1] != QLatin1Char('-') )
        {
            buf += part;
            break;
        }
        buf += part.left(n - 1);
        if( cur + 1 >= lines.size() )
            break;
        cur++;
    }
    return Merged(buf.trimmed(), cur);
}

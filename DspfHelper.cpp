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

#include "DspfHelper.h"
using namespace Dspf;

static QString pad2(quint16 n)
{
    if( n == 0 )
        return QLatin1String("--");
    return QString("%1").arg(n, 2, 10, QLatin1Char('0'));
}

QString Helper::describe(const Element& e)
{
    switch( e.kind )
    {
    case Element::FieldDecl:
        return describeField(e);
    case Element::ConstDecl:
        return describeConstant(e);
    case Element::RecordDecl:
        if( e.size.source == Size::Window )
            return describeSize(e.size);
        break;
    case Element::FileDecl:
        break;
    case Element::AttrLine:
        return formatIndicators(e.indicators);
    }
    return QString();
}

QString Helper::describeField(const Element& e)
{
    if( e.kind != Element::FieldDecl )
        return QString();
    QString size;
    if( e.decimals > 0 )
        size = QString("(%1:%2)").arg(e.length).arg(int(e.decimals));
    else
        size = QString("(%1)").arg(e.length);
    if( e.hidden )
        return size + e.type + QLatin1String(" (Hidden)");
    // fields show column first
    const QString pos = QString("[%1,%2]").arg(pad2(e.col)).arg(pad2(e.row));
    if( e.referenced )
        return QLatin1String("(Referenced) ") + pos;
    return size + e.type + QLatin1Char(' ') + pos;
}

QString Helper::describeConstant(const Element& e)
{
    if( e.kind != Element::ConstDecl )
        return QString();
    return QString("[%1,%2]").arg(pad2(e.row)).arg(pad2(e.col));
}

QString Helper::describeSize(const Size& s)
{
    if( !s.isValid() )
        return QString();
    QString res = QString("%1x%2").arg(s.rows).arg(s.cols);
    if( s.source == Size::Window )
        res += QString(" at %1,%2").arg(s.originRow).arg(s.originCol);
    else if( !s.label.isEmpty() )
        res += QLatin1Char(' ') + s.label;
    return res;
}

QString Helper::formatIndicator(const Indicator& i)
{
    return QString("%1%2").arg(QChar(i.negated ? 'N' : ' '))
            .arg(int(i.number), 2, 10, QLatin1Char('0'));
}

QString Helper::formatIndicators(const Indicators& inds)
{
    if( inds.isEmpty() )
        return QString();
    QString res = QLatin1String("[");
    foreach( const Indicator& i, inds )
        res += formatIndicator(i);
    res += QLatin1Char(']');
    return res;
}

QString Helper::formatAttributes(const Attributes& attrs)
{
    QStringList res;
    foreach( const Attribute& a, attrs )
    {
        const QString inds = formatIndicators(a.indicators);
        if( inds.isEmpty() )
            res << a.text;
        else
            res << inds + QLatin1Char(' ') + a.text;
    }
    return res.join(QLatin1String(", "));
}

namespace
{
    struct Placed
    {
        QString name;
        bool field;
        quint16 row, col, length;
        Placed(const QString& n, bool f, quint16 r, quint16 c, quint16 l):name(n),field(f),row(r),col(c),length(l) {}
    };
}

QList<Helper::Overlap> Helper::findOverlaps(const RecordEntry& rec)
{
    QList<Placed> all;
    foreach( const FieldInfo& f, rec.fields )
    {
        if( f.row > 0 && f.col > 0 )
            all << Placed(f.name, true, f.row, f.col, f.length);
    }
    foreach( const ConstantInfo& c, rec.constants )
    {
        if( c.row > 0 && c.col > 0 )
            all << Placed(c.name, false, c.row, c.col, c.length);
    }

    QList<Overlap> res;
    for( int i = 0; i < all.size(); i++ )
    {
        for( int j = i + 1; j < all.size(); j++ )
        {
            const Placed& a = all[i];
            const Placed& b = all[j];
            if( a.row != b.row )
                continue;
            const int aEnd = a.col + a.length - 1;
            const int bEnd = b.col + b.length - 1;
            if( a.col <= bEnd && b.col <= aEnd )
            {
                Overlap o;
                o.first = a.name;
                o.firstIsField = a.field;
                o.second = b.name;
                o.secondIsField = b.field;
                o.row = a.row;
                res << o;
            }
        }
    }
    return res;
}

bool Helper::recordExists(const Catalog& cat, const QString& name)
{
    foreach( const RecordEntry& r, cat )
    {
        if( r.name.compare(name, Qt::CaseInsensitive) == 0 )
            return true;
    }
    return false;
}

bool Helper::hasSuffix(const QString& path, const QStringList& suffixes)
{
    foreach( const QString& s, suffixes )
    {
        if( path.endsWith(s, Qt::CaseInsensitive) )
            return true;
    }
    return false;
}

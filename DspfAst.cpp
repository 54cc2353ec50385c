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

#include "DspfAst.h"
using namespace Dspf;

bool Attribute::operator==(const Attribute& rhs) const
{
    return text == rhs.text && indicators == rhs.indicators &&
            lineIndex == rhs.lineIndex && lastLineIndex == rhs.lastLineIndex;
}

bool Size::operator==(const Size& rhs) const
{
    return rows == rhs.rows && cols == rhs.cols && label == rhs.label &&
            originRow == rhs.originRow && originCol == rhs.originCol && source == rhs.source;
}

QStringList Element::attributeTexts() const
{
    QStringList res;
    foreach( const Attribute& a, attributes )
    {
        if( !a.text.isEmpty() )
            res << a.text;
    }
    return res;
}

const char* Element::typeName() const
{
    switch( kind )
    {
    case FileDecl:
        return "file";
    case RecordDecl:
        return "record";
    case FieldDecl:
        return "field";
    case ConstDecl:
        return "constant";
    case AttrLine:
        return "attribute";
    default:
        return "";
    }
}

bool Element::operator==(const Element& rhs) const
{
    return kind == rhs.kind && lineIndex == rhs.lineIndex && lastLineIndex == rhs.lastLineIndex &&
            name == rhs.name && record == rhs.record && attributes == rhs.attributes &&
            indicators == rhs.indicators && type == rhs.type && usage == rhs.usage &&
            length == rhs.length && decimals == rhs.decimals && row == rhs.row && col == rhs.col &&
            hidden == rhs.hidden && referenced == rhs.referenced &&
            endLineIndex == rhs.endLineIndex && size == rhs.size;
}

bool FieldInfo::operator==(const FieldInfo& rhs) const
{
    return name == rhs.name && type == rhs.type && row == rhs.row && col == rhs.col &&
            length == rhs.length && attributes == rhs.attributes && indicators == rhs.indicators &&
            lineIndex == rhs.lineIndex && lastLineIndex == rhs.lastLineIndex;
}

bool ConstantInfo::operator==(const ConstantInfo& rhs) const
{
    return name == rhs.name && row == rhs.row && col == rhs.col &&
            length == rhs.length && attributes == rhs.attributes && indicators == rhs.indicators &&
            lineIndex == rhs.lineIndex && lastLineIndex == rhs.lastLineIndex;
}

const FieldInfo* RecordEntry::findField(const QString& name) const
{
    for( int i = 0; i < fields.size(); i++ )
    {
        if( fields[i].name == name )
            return &fields[i];
    }
    return 0;
}

const ConstantInfo* RecordEntry::findConstant(const QString& name) const
{
    for( int i = 0; i < constants.size(); i++ )
    {
        if( constants[i].name == name )
            return &constants[i];
    }
    return 0;
}

bool RecordEntry::operator==(const RecordEntry& rhs) const
{
    return name == rhs.name && attributes == rhs.attributes && fields == rhs.fields &&
            constants == rhs.constants && startLine == rhs.startLine && endLine == rhs.endLine &&
            size == rhs.size && subfile == rhs.subfile;
}

const RecordEntry* Document::findRecord(const QString& name) const
{
    for( int i = 0; i < catalog.size(); i++ )
    {
        if( catalog[i].name == name )
            return &catalog[i];
    }
    return 0;
}

RecordEntry* Document::findRecord(const QString& name)
{
    for( int i = 0; i < catalog.size(); i++ )
    {
        if( catalog[i].name == name )
            return &catalog[i];
    }
    return 0;
}

const Element* Document::findRecordDecl(const QString& name) const
{
    for( int i = 0; i < elements.size(); i++ )
    {
        if( elements[i].kind == Element::RecordDecl && elements[i].name == name )
            return &elements[i];
    }
    return 0;
}

QList<const Element*> Document::records() const
{
    QList<const Element*> res;
    for( int i = 0; i < elements.size(); i++ )
    {
        if( elements[i].kind == Element::RecordDecl )
            res << &elements[i];
    }
    return res;
}

void Document::clear()
{
    elements.clear();
    catalog.clear();
    defaultSize = Size();
    alternateSize = Size();
    lineCount = 0;
}

bool Document::operator==(const Document& rhs) const
{
    return elements == rhs.elements && catalog == rhs.catalog && defaultSize == rhs.defaultSize &&
            alternateSize == rhs.alternateSize && lineCount == rhs.lineCount;
}

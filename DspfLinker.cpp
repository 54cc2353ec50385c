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

#include "DspfLinker.h"
#include <algorithm>
using namespace Dspf;

void Linker::link(Document& doc)
{
    attachAttributes(doc.elements);
    attachToRecords(doc);
    syncRecords(doc);
    dropAttrLines(doc.elements);
}

void Linker::attachAttributes(ElementList& elements)
{
    for( int i = 0; i < elements.size(); i++ )
    {
        if( elements[i].kind != Element::AttrLine )
            continue;
        const Element& attr = elements[i];
        for( int j = i - 1; j >= 0; j-- )
        {
            Element& owner = elements[j];
            if( !owner.isOwner() )
                continue;
            // the file owns everything preceding the first record, even keywords on line 0
            if( owner.kind != Element::FileDecl && owner.lineIndex >= attr.lineIndex )
                continue;
            owner.attributes += attr.attributes;
            if( owner.kind != Element::FileDecl )
                owner.lastLineIndex = qMax(owner.lastLineIndex, attr.lastLineIndex);
            break;
        }
        // no owner: the keyword line is dropped
    }
}

void Linker::attachToRecords(Document& doc)
{
    // elements are in line order, so the last record seen is the nearest preceding one
    int rec = -1;
    for( int i = 0; i < doc.elements.size(); i++ )
    {
        Element& e = doc.elements[i];
        if( e.kind == Element::RecordDecl )
        {
            rec = i;
            continue;
        }
        if( e.kind != Element::FieldDecl && e.kind != Element::ConstDecl )
            continue;
        if( rec == -1 )
            continue;
        Q_ASSERT( doc.elements[rec].lineIndex < e.lineIndex );
        e.record = doc.elements[rec].name;
        RecordEntry* entry = doc.findRecord(e.record);
        if( entry == 0 )
            continue;
        if( e.kind == Element::FieldDecl )
        {
            if( e.hidden )
                continue;
            if( entry->findField(e.name) == 0 )
                entry->fields.append(toFieldInfo(e));
        }else
        {
            const ConstantInfo info = toConstantInfo(e);
            if( entry->findConstant(info.name) == 0 )
                entry->constants.append(info);
        }
    }
}

void Linker::syncRecords(Document& doc)
{
    for( int i = 0; i < doc.elements.size(); i++ )
    {
        const Element& e = doc.elements[i];
        if( e.kind != Element::RecordDecl )
            continue;
        RecordEntry* entry = doc.findRecord(e.name);
        if( entry == 0 || entry->startLine != e.lineIndex )
            continue;
        entry->attributes = e.attributeTexts();
        entry->subfile = hasKeyword(e, QLatin1String("SFL"));
    }
}

void Linker::dropAttrLines(ElementList& elements)
{
    ElementList::iterator i = elements.begin();
    while( i != elements.end() )
    {
        if( (*i).kind == Element::AttrLine )
            i = elements.erase(i);
        else
            ++i;
    }
}

static bool LineLessThan(const Element* lhs, const Element* rhs)
{
    return lhs->lineIndex < rhs->lineIndex;
}

void Linker::assignEndLines(Document& doc)
{
    QList<Element*> recs;
    for( int i = 0; i < doc.elements.size(); i++ )
    {
        if( doc.elements[i].kind == Element::RecordDecl )
            recs << &doc.elements[i];
    }
    std::sort( recs.begin(), recs.end(), LineLessThan );

    for( int i = 0; i < recs.size(); i++ )
    {
        Element* rec = recs[i];
        rec->endLineIndex = i + 1 < recs.size() ? recs[i+1]->lineIndex - 1 : doc.lineCount - 1;
        RecordEntry* entry = doc.findRecord(rec->name);
        if( entry && entry->startLine == rec->lineIndex )
            entry->endLine = rec->endLineIndex;
    }
}

bool Linker::hasKeyword(const Element& owner, const QString& keyword)
{
    foreach( const Attribute& a, owner.attributes )
    {
        foreach( const QString& w, keywordNames(a.text) )
        {
            if( w.compare(keyword, Qt::CaseInsensitive) == 0 )
                return true;
        }
    }
    return false;
}

QStringList Linker::keywordNames(const QString& text)
{
    // only words on the outer level count; parameters and quoted literals are skipped
    QStringList res;
    QString word;
    int level = 0;
    bool quoted = false;
    for( int i = 0; i < text.size(); i++ )
    {
        const QChar ch = text[i];
        if( quoted )
        {
            if( ch == QLatin1Char('\'') )
                quoted = false;
            continue;
        }
        if( level == 0 && ch.isLetterOrNumber() )
        {
            word += ch;
            continue;
        }
        if( !word.isEmpty() )
        {
            res << word;
            word.clear();
        }
        if( ch == QLatin1Char('\'') )
            quoted = true;
        else if( ch == QLatin1Char('(') )
            level++;
        else if( ch == QLatin1Char(')') && level > 0 )
            level--;
    }
    if( !word.isEmpty() )
        res << word;
    return res;
}

FieldInfo Linker::toFieldInfo(const Element& e)
{
    FieldInfo info;
    info.name = e.name;
    info.type = e.type;
    info.row = e.row;
    info.col = e.col;
    info.length = e.length;
    info.attributes = e.attributeTexts();
    info.indicators = e.indicators;
    info.lineIndex = e.lineIndex;
    info.lastLineIndex = e.lastLineIndex;
    return info;
}

ConstantInfo Linker::toConstantInfo(const Element& e)
{
    ConstantInfo info;
    info.name = e.name;
    if( info.name.size() >= 2 && info.name.startsWith(QLatin1Char('\'')) &&
            info.name.endsWith(QLatin1Char('\'')) )
        info.name = info.name.mid(1, info.name.size() - 2);
    info.row = e.row;
    info.col = e.col;
    info.length = info.name.size();
    info.attributes = e.attributeTexts();
    info.indicators = e.indicators;
    info.lineIndex = e.lineIndex;
    info.lastLineIndex = e.lastLineIndex;
    return info;
}

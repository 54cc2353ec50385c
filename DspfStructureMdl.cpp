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

#include "DspfStructureMdl.h"
#include "DspfHelper.h"
using namespace Dspf;

void ModelItem::clear()
{
    foreach( ModelItem* s, d_children )
        delete s;
    d_children.clear();
}

StructureMdl::StructureMdl(QObject *parent) : QAbstractItemModel(parent),
    d_showFields(true),d_showConstants(true)
{
}

void StructureMdl::load(const Document& doc, const QString& fileName)
{
    d_doc = doc;
    d_fileName = fileName;
    rebuild();
}

void StructureMdl::clear()
{
    load(Document());
}

const Element* StructureMdl::getElement(const QModelIndex& index) const
{
    const ModelItem* s = toItem(index);
    if( s == 0 || s->d_elem < 0 || s->d_elem >= d_doc.elements.size() )
        return 0;
    return &d_doc.elements[s->d_elem];
}

const Attribute* StructureMdl::getAttribute(const QModelIndex& index) const
{
    const ModelItem* s = toItem(index);
    if( s == 0 || s->d_kind != ModelItem::AttributeNode )
        return 0;
    const Element* e = getElement(index);
    Q_ASSERT( e != 0 && s->d_sub >= 0 && s->d_sub < e->attributes.size() );
    return &e->attributes[s->d_sub];
}

int StructureMdl::getLine(const QModelIndex& index) const
{
    const ModelItem* s = toItem(index);
    if( s == 0 || s->isGroup() || s->d_kind == ModelItem::IndicatorNode )
        return -1;
    if( s->d_kind == ModelItem::AttributeNode )
        return getAttribute(index)->lineIndex;
    const Element* e = getElement(index);
    return e ? e->lineIndex : -1;
}

QModelIndex StructureMdl::findRecord(const QString& name) const
{
    foreach( ModelItem* top, d_root.d_children )
    {
        if( top->d_kind != ModelItem::RecordsGroup )
            continue;
        for( int i = 0; i < top->d_children.size(); i++ )
        {
            ModelItem* s = top->d_children[i];
            if( d_doc.elements[s->d_elem].name == name )
                return createIndex( i, 0, s );
        }
    }
    return QModelIndex();
}

void StructureMdl::setRecordFilter(const QStringList& names)
{
    d_recordFilter = names;
    rebuild();
}

void StructureMdl::setKindVisible(Element::Kind kind, bool on)
{
    if( kind == Element::FieldDecl )
        d_showFields = on;
    else if( kind == Element::ConstDecl )
        d_showConstants = on;
    else
        return;
    rebuild();
}

bool StructureMdl::isKindVisible(Element::Kind kind) const
{
    if( kind == Element::FieldDecl )
        return d_showFields;
    if( kind == Element::ConstDecl )
        return d_showConstants;
    return true;
}

void StructureMdl::showAll()
{
    d_recordFilter.clear();
    d_showFields = true;
    d_showConstants = true;
    rebuild();
}

QVariant StructureMdl::data(const QModelIndex& index, int role) const
{
    const ModelItem* s = toItem(index);
    if( s == 0 )
        return QVariant();
    switch( role )
    {
    case Qt::DisplayRole:
        return label(s);
    case Qt::ToolTipRole:
        if( s->d_kind == ModelItem::AttributeNode )
            return QLatin1String("attribute");
        if( !s->isGroup() && s->d_kind != ModelItem::IndicatorNode && getElement(index) )
            return QLatin1String(getElement(index)->typeName());
        break;
    case LineRole:
        {
            const int line = getLine(index);
            if( line >= 0 )
                return line;
        }
        break;
    case DescriptionRole:
        if( s->d_kind == ModelItem::AttributeNode )
            return Helper::formatIndicators(getAttribute(index)->indicators);
        if( s->d_kind == ModelItem::RecordNode || s->d_kind == ModelItem::FieldNode ||
                s->d_kind == ModelItem::ConstantNode )
            return Helper::describe(*getElement(index));
        break;
    case KindRole:
        return int(s->d_kind);
    }
    return QVariant();
}

QModelIndex StructureMdl::index(int row, int column, const QModelIndex& parent) const
{
    const ModelItem* s = &d_root;
    if( parent.isValid() )
    {
        s = static_cast<ModelItem*>( parent.internalPointer() );
        Q_ASSERT( s != 0 );
    }
    if( row >= 0 && row < s->d_children.size() && column < columnCount( parent ) )
        return createIndex( row, column, s->d_children[row] );
    else
        return QModelIndex();
}

QModelIndex StructureMdl::parent(const QModelIndex& index) const
{
    if( index.isValid() )
    {
        ModelItem* s = static_cast<ModelItem*>( index.internalPointer() );
        Q_ASSERT( s != 0 );
        if( s->d_parent == &d_root )
            return QModelIndex();
        // else
        Q_ASSERT( s->d_parent != 0 );
        Q_ASSERT( s->d_parent->d_parent != 0 );
        return createIndex( s->d_parent->d_parent->d_children.indexOf( s->d_parent ), 0, s->d_parent );
    }else
        return QModelIndex();
}

int StructureMdl::rowCount(const QModelIndex& parent) const
{
    if( parent.isValid() )
    {
        ModelItem* s = static_cast<ModelItem*>( parent.internalPointer() );
        Q_ASSERT( s != 0 );
        return s->d_children.size();
    }else
        return d_root.d_children.size();
}

void StructureMdl::rebuild()
{
    beginResetModel();
    d_root.clear();
    if( !d_doc.isEmpty() )
    {
        ModelItem* file = new ModelItem(&d_root, ModelItem::FileNode, 0);
        fillAttributes(file, 0);
        ModelItem* records = new ModelItem(&d_root, ModelItem::RecordsGroup);
        for( int i = 0; i < d_doc.elements.size(); i++ )
        {
            const Element& e = d_doc.elements[i];
            if( e.kind != Element::RecordDecl )
                continue;
            if( !d_recordFilter.isEmpty() && !d_recordFilter.contains(e.name) )
                continue;
            fillRecord(records, i);
        }
    }
    endResetModel();
}

void StructureMdl::fillRecord(ModelItem* records, int elem)
{
    const Element& rec = d_doc.elements[elem];
    ModelItem* item = new ModelItem(records, ModelItem::RecordNode, elem);
    fillAttributes(item, elem);

    ModelItem* items = 0;
    for( int i = elem + 1; i < d_doc.elements.size(); i++ )
    {
        const Element& e = d_doc.elements[i];
        if( e.kind == Element::RecordDecl )
            break;
        if( e.kind != Element::FieldDecl && e.kind != Element::ConstDecl )
            continue;
        if( !isKindVisible(Element::Kind(e.kind)) )
            continue;
        Q_ASSERT( e.record == rec.name );
        if( items == 0 )
            items = new ModelItem(item, ModelItem::ItemsGroup, elem);
        fillItem(items, i);
    }
}

void StructureMdl::fillItem(ModelItem* items, int elem)
{
    const Element& e = d_doc.elements[elem];
    ModelItem* item = new ModelItem(items, e.kind == Element::FieldDecl ?
                                        ModelItem::FieldNode : ModelItem::ConstantNode, elem);
    if( !e.indicators.isEmpty() )
    {
        ModelItem* inds = new ModelItem(item, ModelItem::IndicatorsGroup, elem);
        for( int i = 0; i < e.indicators.size(); i++ )
            new ModelItem(inds, ModelItem::IndicatorNode, elem, i);
    }
    fillAttributes(item, elem);
}

void StructureMdl::fillAttributes(ModelItem* parentItem, int elem)
{
    const Element& e = d_doc.elements[elem];
    if( e.attributes.isEmpty() )
        return;
    ModelItem* attrs = new ModelItem(parentItem, ModelItem::AttributesGroup, elem);
    for( int i = 0; i < e.attributes.size(); i++ )
        new ModelItem(attrs, ModelItem::AttributeNode, elem, i);
}

QString StructureMdl::label(const ModelItem* s) const
{
    switch( s->d_kind )
    {
    case ModelItem::FileNode:
        if( d_fileName.isEmpty() )
            return QLatin1String("File");
        return QString("File (%1)").arg(d_fileName);
    case ModelItem::RecordsGroup:
        return QLatin1String("Records");
    case ModelItem::AttributesGroup:
        return QLatin1String("Attributes");
    case ModelItem::ItemsGroup:
        return QLatin1String("Fields and Constants");
    case ModelItem::IndicatorsGroup:
        return QLatin1String("Indicators");
    case ModelItem::RecordNode:
    case ModelItem::FieldNode:
    case ModelItem::ConstantNode:
        return d_doc.elements[s->d_elem].name;
    case ModelItem::AttributeNode:
        return d_doc.elements[s->d_elem].attributes[s->d_sub].text;
    case ModelItem::IndicatorNode:
        {
            const Indicator& i = d_doc.elements[s->d_elem].indicators[s->d_sub];
            return QString("%1: %2").arg(int(i.number), 2, 10, QLatin1Char('0'))
                    .arg(i.negated ? "OFF" : "ON");
        }
    }
    return QString();
}

const ModelItem* StructureMdl::toItem(const QModelIndex& index) const
{
    if( !index.isValid() )
        return 0;
    const ModelItem* s = static_cast<ModelItem*>( index.internalPointer() );
    Q_ASSERT( s != 0 );
    return s;
}
